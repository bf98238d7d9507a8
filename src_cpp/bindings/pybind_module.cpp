// src_cpp/bindings/pybind_module.cpp
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <string>
#include <vector>

#include "gravbody/api.hpp"
#include "gravbody/diagnostics.hpp"
#include "gravbody/errors.hpp"
#include "gravbody/models/newton.hpp"
#include "gravbody/output.hpp"
#include "gravbody/registry.hpp"
#include "gravbody/scenarios.hpp"
#include "gravbody/types.hpp"

namespace py = pybind11;

PYBIND11_MODULE(_engine, m) {
    m.doc() = "gravbody C++ engine (pybind11)";

    m.def("hello", []() { return std::string("gravbody C++ engine: OK"); });

    py::register_exception<gravbody::ValidationError>(m, "ValidationError", PyExc_ValueError);
    py::register_exception<gravbody::ShapeError>(m, "ShapeError", PyExc_ValueError);
    py::register_exception<gravbody::IntegrationError>(m, "IntegrationError", PyExc_RuntimeError);

    m.attr("G") = gravbody::kGravitationalConstant;

    py::enum_<gravbody::SolveStatus>(m, "SolveStatus")
        .value("SUCCESS", gravbody::SolveStatus::SUCCESS)
        .value("NON_FINITE", gravbody::SolveStatus::NON_FINITE)
        .value("STEP_TOO_SMALL", gravbody::SolveStatus::STEP_TOO_SMALL)
        .value("TOO_MANY_STEPS", gravbody::SolveStatus::TOO_MANY_STEPS);

    py::enum_<gravbody::SolverMethod>(m, "SolverMethod")
        .value("AUTO", gravbody::SolverMethod::AUTO)
        .value("NONSTIFF", gravbody::SolverMethod::NONSTIFF)
        .value("STIFF", gravbody::SolverMethod::STIFF);

    py::enum_<gravbody::OrbitStatus>(m, "OrbitStatus")
        .value("BOUND", gravbody::OrbitStatus::BOUND)
        .value("UNBOUND", gravbody::OrbitStatus::UNBOUND);

    py::class_<gravbody::Presentation>(m, "Presentation")
        .def(py::init<>())
        .def(py::init([](double radius, const std::string& color, const std::string& gradient) {
                 return gravbody::Presentation{radius, color, gradient};
             }),
             py::arg("radius") = 0.0, py::arg("color") = "", py::arg("color_gradient") = "")
        .def_readwrite("radius", &gravbody::Presentation::radius)
        .def_readwrite("color", &gravbody::Presentation::color)
        .def_readwrite("color_gradient", &gravbody::Presentation::color_gradient);

    py::class_<gravbody::BodyDescriptor>(m, "BodyDescriptor")
        .def(py::init<>())
        .def(py::init([](const std::string& name, double mass,
                         const std::vector<double>& position, const std::vector<double>& velocity,
                         const gravbody::Presentation& presentation) {
                 return gravbody::BodyDescriptor{name, mass, position, velocity, presentation};
             }),
             py::arg("name"), py::arg("mass"), py::arg("position"), py::arg("velocity"),
             py::arg("presentation") = gravbody::Presentation{})
        .def_readwrite("name", &gravbody::BodyDescriptor::name)
        .def_readwrite("mass", &gravbody::BodyDescriptor::mass)
        .def_readwrite("position", &gravbody::BodyDescriptor::position)
        .def_readwrite("velocity", &gravbody::BodyDescriptor::velocity)
        .def_readwrite("presentation", &gravbody::BodyDescriptor::presentation);

    py::class_<gravbody::Body>(m, "Body")
        .def_readonly("name", &gravbody::Body::name)
        .def_readonly("mass", &gravbody::Body::mass)
        .def_readonly("position", &gravbody::Body::position)
        .def_readonly("velocity", &gravbody::Body::velocity);

    py::class_<gravbody::BodyState>(m, "BodyState")
        .def_readonly("position", &gravbody::BodyState::position)
        .def_readonly("velocity", &gravbody::BodyState::velocity);

    py::class_<gravbody::SimulationCfg>(m, "SimulationCfg")
        .def(py::init<>())
        .def_readwrite("G", &gravbody::SimulationCfg::G)
        .def_readwrite("time_span", &gravbody::SimulationCfg::time_span)
        .def_readwrite("n_samples", &gravbody::SimulationCfg::n_samples)
        .def_readwrite("softening", &gravbody::SimulationCfg::softening);

    py::class_<gravbody::SolverCfg>(m, "SolverCfg")
        .def(py::init<>())
        .def_readwrite("rtol", &gravbody::SolverCfg::rtol)
        .def_readwrite("atol", &gravbody::SolverCfg::atol)
        .def_readwrite("h0", &gravbody::SolverCfg::h0)
        .def_readwrite("h_max", &gravbody::SolverCfg::h_max)
        .def_readwrite("max_steps", &gravbody::SolverCfg::max_steps)
        .def_readwrite("method", &gravbody::SolverCfg::method);

    py::class_<gravbody::SolverStats>(m, "SolverStats")
        .def_readonly("n_accepted", &gravbody::SolverStats::n_accepted)
        .def_readonly("n_rejected", &gravbody::SolverStats::n_rejected)
        .def_readonly("n_rhs", &gravbody::SolverStats::n_rhs)
        .def_readonly("n_jacobian", &gravbody::SolverStats::n_jacobian)
        .def_readonly("n_switches", &gravbody::SolverStats::n_switches)
        .def_readonly("ended_stiff", &gravbody::SolverStats::ended_stiff);

    py::class_<gravbody::BodyRegistry>(m, "BodyRegistry")
        .def(py::init<const std::vector<gravbody::BodyDescriptor>&>(), py::arg("bodies"))
        .def("__len__", &gravbody::BodyRegistry::size)
        .def_property_readonly("dim", &gravbody::BodyRegistry::dim)
        .def_property_readonly("state_size", &gravbody::BodyRegistry::state_size)
        .def_property_readonly("bodies", &gravbody::BodyRegistry::bodies)
        .def("names", &gravbody::BodyRegistry::names)
        .def("masses", &gravbody::BodyRegistry::masses)
        .def("index_of", &gravbody::BodyRegistry::index_of, py::arg("name"))
        .def("presentation", &gravbody::BodyRegistry::presentation, py::arg("i"),
             py::return_value_policy::copy)
        .def("encode_initial_state", &gravbody::BodyRegistry::encode_initial_state)
        .def("decode_state",
             py::overload_cast<const std::vector<double>&>(&gravbody::BodyRegistry::decode_state, py::const_),
             py::arg("state"));

    py::class_<gravbody::Trajectory>(m, "Trajectory")
        .def_readonly("names", &gravbody::Trajectory::names)
        .def_readonly("dim", &gravbody::Trajectory::dim)
        .def_readonly("t", &gravbody::Trajectory::t)
        .def_readonly("states", &gravbody::Trajectory::states)
        .def_readonly("status", &gravbody::Trajectory::status)
        .def_readonly("message", &gravbody::Trajectory::message)
        .def_readonly("stats", &gravbody::Trajectory::stats)
        .def("__len__", [](const gravbody::Trajectory& tr) { return tr.t.size(); })
        // posições de um corpo ao longo do tempo, pronto para plot
        .def("positions", [](const gravbody::Trajectory& tr, const std::string& name) {
            const std::size_t i = gravbody::find_body(tr, name);
            std::vector<std::vector<double>> out;
            out.reserve(tr.states.size());
            for (const auto& row : tr.states) out.push_back(row[i].position);
            return out;
        }, py::arg("name"))
        .def("velocities", [](const gravbody::Trajectory& tr, const std::string& name) {
            const std::size_t i = gravbody::find_body(tr, name);
            std::vector<std::vector<double>> out;
            out.reserve(tr.states.size());
            for (const auto& row : tr.states) out.push_back(row[i].velocity);
            return out;
        }, py::arg("name"));

    py::class_<gravbody::Diagnostics>(m, "Diagnostics")
        .def_readonly("t", &gravbody::Diagnostics::t)
        .def_readonly("energy", &gravbody::Diagnostics::energy)
        .def_readonly("angular_momentum", &gravbody::Diagnostics::angular_momentum)
        .def_readonly("momentum", &gravbody::Diagnostics::momentum)
        .def_readonly("center_of_mass", &gravbody::Diagnostics::center_of_mass);

    py::class_<gravbody::TwoBodyElements>(m, "TwoBodyElements")
        .def_readonly("mu", &gravbody::TwoBodyElements::mu)
        .def_readonly("specific_energy", &gravbody::TwoBodyElements::specific_energy)
        .def_readonly("specific_angular_momentum", &gravbody::TwoBodyElements::specific_angular_momentum)
        .def_readonly("eccentricity", &gravbody::TwoBodyElements::eccentricity)
        .def_readonly("semi_major_axis", &gravbody::TwoBodyElements::semi_major_axis)
        .def_readonly("period", &gravbody::TwoBodyElements::period)
        .def_readonly("status", &gravbody::TwoBodyElements::status);

    py::class_<gravbody::Scenario>(m, "Scenario")
        .def_readonly("name", &gravbody::Scenario::name)
        .def_readonly("title", &gravbody::Scenario::title)
        .def_readonly("bodies", &gravbody::Scenario::bodies)
        .def_readonly("sim", &gravbody::Scenario::sim);

    // ponteiro explícito para a sobrecarga com cfg
    using IntegrateFn = gravbody::Trajectory (*)(
        const gravbody::BodyRegistry&, const gravbody::SimulationCfg&, const gravbody::SolverCfg&
    );
    IntegrateFn integrate_cfg = &gravbody::integrate;

    m.def("integrate", integrate_cfg,
          py::arg("registry"),
          py::arg("sim"),
          py::arg("cfg") = gravbody::SolverCfg{},
          "Integrate the N-body system; returns states at n_samples evenly spaced times in [0, time_span].");

    m.def("integrate_simple",
          [](const gravbody::BodyRegistry& registry, double time_span, double G, int n_samples) {
              return gravbody::integrate(registry, G, time_span, n_samples);
          },
          py::arg("registry"),
          py::arg("time_span"),
          py::arg("G") = gravbody::kGravitationalConstant,
          py::arg("n_samples") = 404);

    m.def("derivative",
          [](const gravbody::BodyRegistry& registry, const std::vector<double>& state, double G, double softening) {
              return gravbody::NewtonGravity(registry, G, softening).derivative(state, 0.0);
          },
          py::arg("registry"), py::arg("state"), py::arg("G"), py::arg("softening") = 0.0);

    m.def("sample_times", &gravbody::sample_times, py::arg("time_span"), py::arg("n_samples"));
    m.def("require_complete", &gravbody::require_complete, py::arg("trajectory"));

    m.def("compute_diagnostics", &gravbody::compute_diagnostics,
          py::arg("trajectory"), py::arg("masses"), py::arg("G"));
    m.def("max_relative_drift", &gravbody::max_relative_drift, py::arg("series"));

    using ElementsFn = gravbody::TwoBodyElements (*)(const gravbody::BodyRegistry&, double);
    ElementsFn elements_fn = &gravbody::two_body_elements;
    m.def("two_body_elements", elements_fn, py::arg("registry"), py::arg("G"));

    m.def("scenario_names", &gravbody::scenario_names);
    m.def("make_scenario", &gravbody::make_scenario, py::arg("name"));

    using CsvFn = void (*)(const std::string&, const gravbody::Trajectory&, const gravbody::BodyRegistry&, double);
    CsvFn csv_fn = &gravbody::write_csv;
    m.def("write_csv", csv_fn, py::arg("path"), py::arg("trajectory"), py::arg("registry"), py::arg("G"));
}
