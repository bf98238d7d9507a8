#include "gravbody/api.hpp"

#include <cmath>
#include <sstream>

#include <Eigen/Dense>

#include "gravbody/errors.hpp"
#include "gravbody/models/newton.hpp"
#include "gravbody/solver.hpp"

namespace gravbody {

static void validate_sim(const SimulationCfg& sim) {
    if (!(sim.G > 0.0) || !std::isfinite(sim.G)) throw ValidationError("G must be > 0 and finite");
    if (!(sim.time_span > 0.0) || !std::isfinite(sim.time_span)) {
        throw ValidationError("time_span must be > 0 and finite");
    }
    if (sim.n_samples < 2) throw ValidationError("n_samples must be >= 2");
    if (!(sim.softening >= 0.0) || !std::isfinite(sim.softening)) {
        throw ValidationError("softening must be >= 0 and finite");
    }
}

std::vector<double> sample_times(double time_span, int n_samples) {
    if (n_samples < 2) throw ValidationError("n_samples must be >= 2");
    std::vector<double> t(static_cast<std::size_t>(n_samples));
    const double last = static_cast<double>(n_samples - 1);
    for (int k = 0; k < n_samples; ++k) {
        t[static_cast<std::size_t>(k)] = time_span * (static_cast<double>(k) / last);
    }
    t.back() = time_span;
    return t;
}

Trajectory integrate(
    const BodyRegistry& registry,
    const SimulationCfg& sim,
    const SolverCfg& cfg
) {
    validate_sim(sim);

    const NewtonGravity model(registry, sim.G, sim.softening);

    OdeSystem sys;
    sys.rhs = [&model](double /*t*/, const Eigen::VectorXd& y, Eigen::VectorXd& dydt) {
        model.rhs(y.data(), dydt.data());
    };
    sys.jacobian = [&model](double /*t*/, const Eigen::VectorXd& y, Eigen::MatrixXd& J) {
        model.jacobian(y.data(), J);
    };

    const std::vector<double> s0 = registry.encode_initial_state();
    const Eigen::VectorXd y0 = Eigen::Map<const Eigen::VectorXd>(s0.data(), static_cast<Eigen::Index>(s0.size()));

    const OdeSolution sol = solve_at_times(sys, y0, sample_times(sim.time_span, sim.n_samples), cfg);

    Trajectory out;
    out.names = registry.names();
    out.dim = registry.dim();
    out.t = sol.t;
    out.states.reserve(sol.y.size());
    for (const auto& row : sol.y) {
        out.states.push_back(registry.decode_state(row.data(), static_cast<std::size_t>(row.size())));
    }
    out.status = sol.status;
    out.message = sol.message;
    out.stats = sol.stats;

    return out;
}

Trajectory integrate(
    const BodyRegistry& registry,
    double G,
    double time_span,
    int n_samples
) {
    SimulationCfg sim;
    sim.G = G;
    sim.time_span = time_span;
    sim.n_samples = n_samples;
    return integrate(registry, sim);
}

void require_complete(const Trajectory& traj) {
    if (traj.status == SolveStatus::SUCCESS) return;
    std::ostringstream os;
    os << "integration failed (" << to_string(traj.status) << "): " << traj.message;
    throw IntegrationError(os.str());
}

std::size_t find_body(const Trajectory& traj, const std::string& name) {
    for (std::size_t i = 0; i < traj.names.size(); ++i) {
        if (traj.names[i] == name) return i;
    }
    throw ValidationError("unknown body '" + name + "'");
}

const char* to_string(SolveStatus status) {
    switch (status) {
        case SolveStatus::SUCCESS: return "SUCCESS";
        case SolveStatus::NON_FINITE: return "NON_FINITE";
        case SolveStatus::STEP_TOO_SMALL: return "STEP_TOO_SMALL";
        case SolveStatus::TOO_MANY_STEPS: return "TOO_MANY_STEPS";
    }
    return "UNKNOWN";
}

} // namespace gravbody
