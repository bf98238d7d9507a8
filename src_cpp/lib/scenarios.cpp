#include "gravbody/scenarios.hpp"

#include <utility>

#include "gravbody/errors.hpp"

namespace gravbody {

static BodyDescriptor make_body(
    const std::string& name, double mass,
    std::vector<double> r, std::vector<double> v,
    double radius, const std::string& color, const std::string& gradient
) {
    BodyDescriptor b;
    b.name = name;
    b.mass = mass;
    b.position = std::move(r);
    b.velocity = std::move(v);
    b.presentation.radius = radius;
    b.presentation.color = color;
    b.presentation.color_gradient = gradient;
    return b;
}

// estável, plano (unidades SI)
static Scenario two_body_xy() {
    Scenario s;
    s.name = "two_body_xy";
    s.title = "Stable Evolution of a Two-Body System in Two-Dimensional Space";
    s.bodies = {
        make_body("a", 0.1e10, {-0.5, 0.0}, {0.02, 0.1}, 0.125, "dodgerblue", "mediumseagreen"),
        make_body("b", 0.1e6, {0.5, 0.0}, {-0.08, -0.06}, 0.1, "darkred", "crimson"),
    };
    s.sim.G = kGravitationalConstant;
    s.sim.time_span = 36.0;
    s.sim.n_samples = 404;
    return s;
}

static Scenario two_body_xyz() {
    Scenario s;
    s.name = "two_body_xyz";
    s.title = "Stable Evolution of a Two-Body System in Three-Dimensional Space";
    s.bodies = {
        make_body("a", 0.1e10, {-0.5, 0.0, 1.0}, {0.02, 0.1, 0.04}, 0.125, "#636ef9", "dodgerblue"),
        make_body("b", 0.1e6, {0.5, 0.0, -1.0}, {0.08, -0.1, 0.04}, 0.1, "#ef553b", "crimson"),
    };
    s.sim.G = kGravitationalConstant;
    s.sim.time_span = 480.0;
    s.sim.n_samples = 600;
    return s;
}

// caótico (posições em km, velocidades em km/s nos scripts)
static Scenario three_body_xyz() {
    Scenario s;
    s.name = "three_body_xyz";
    s.title = "Chaotic Evolution of a Three-Body System in Three-Dimensional Space";
    s.bodies = {
        make_body("a", 0.1e9, {0.1, 0.0, 0.4}, {0.02, -0.02, 0.08}, 0.1, "#636ef9", "dodgerblue"),
        make_body("b", 0.6e8, {0.2, 0.1, 0.0}, {0.1, 0.1, -0.02}, 0.1, "#ef553b", "crimson"),
        make_body("c", 0.1e9, {-0.1, 0.0, -0.1}, {-0.04, -0.175, -0.01}, 0.1, "limegreen", "mediumseagreen"),
    };
    s.sim.G = kGravitationalConstant;
    s.sim.time_span = 200.0;
    s.sim.n_samples = 500;
    return s;
}

// órbita em oito (Chenciner-Montgomery), G = 1, massas unitárias
static Scenario three_body_figure_eight() {
    const double x1 = -0.97000436, y1 = 0.24308753;
    const double vx3 = 0.93240737, vy3 = 0.86473146;

    Scenario s;
    s.name = "three_body_figure_eight";
    s.title = "Figure-Eight Solution of the Three-Body Problem";
    s.bodies = {
        make_body("a", 1.0, {x1, y1}, {-vx3 / 2.0, -vy3 / 2.0}, 0.05, "#636ef9", "dodgerblue"),
        make_body("b", 1.0, {-x1, -y1}, {-vx3 / 2.0, -vy3 / 2.0}, 0.05, "#ef553b", "crimson"),
        make_body("c", 1.0, {0.0, 0.0}, {vx3, vy3}, 0.05, "limegreen", "mediumseagreen"),
    };
    s.sim.G = 1.0;
    s.sim.time_span = 20.0;
    s.sim.n_samples = 800;
    return s;
}

std::vector<std::string> scenario_names() {
    return {"two_body_xy", "two_body_xyz", "three_body_xyz", "three_body_figure_eight"};
}

Scenario make_scenario(const std::string& name) {
    if (name == "two_body_xy") return two_body_xy();
    if (name == "two_body_xyz") return two_body_xyz();
    if (name == "three_body_xyz") return three_body_xyz();
    if (name == "three_body_figure_eight") return three_body_figure_eight();
    throw ValidationError("unknown scenario '" + name + "'");
}

} // namespace gravbody
