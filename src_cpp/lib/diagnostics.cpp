#include "gravbody/diagnostics.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <sstream>

#include "gravbody/errors.hpp"
#include "gravbody/models/newton.hpp"

namespace gravbody {

static constexpr double kPi = 3.14159265358979323846;

static void check_sizes(const std::vector<BodyState>& states, const std::vector<double>& masses) {
    if (states.size() != masses.size()) {
        std::ostringstream os;
        os << "got " << masses.size() << " masses for " << states.size() << " bodies";
        throw ShapeError(os.str());
    }
}

static inline std::array<double, 3> to3(const std::vector<double>& v) {
    std::array<double, 3> a{0.0, 0.0, 0.0};
    for (std::size_t k = 0; k < v.size() && k < 3; ++k) a[k] = v[k];
    return a;
}

double total_energy(const std::vector<BodyState>& states, const std::vector<double>& masses, double G) {
    check_sizes(states, masses);
    const std::size_t n = states.size();

    double kinetic = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        double v2 = 0.0;
        for (double c : states[i].velocity) v2 += c * c;
        kinetic += 0.5 * masses[i] * v2;
    }

    double potential = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        for (std::size_t j = i + 1; j < n; ++j) {
            double r2 = 0.0;
            for (std::size_t k = 0; k < states[i].position.size(); ++k) {
                const double d = states[j].position[k] - states[i].position[k];
                r2 += d * d;
            }
            potential -= G * masses[i] * masses[j] / std::sqrt(r2);
        }
    }
    return kinetic + potential;
}

std::vector<double> total_angular_momentum(const std::vector<BodyState>& states, const std::vector<double>& masses) {
    check_sizes(states, masses);
    std::array<double, 3> L{0.0, 0.0, 0.0};
    for (std::size_t i = 0; i < states.size(); ++i) {
        const auto h = specific_angular_momentum(to3(states[i].position), to3(states[i].velocity));
        for (int k = 0; k < 3; ++k) L[k] += masses[i] * h[k];
    }
    const bool planar = !states.empty() && states.front().position.size() == 2;
    if (planar) return {L[2]};
    return {L[0], L[1], L[2]};
}

std::vector<double> total_momentum(const std::vector<BodyState>& states, const std::vector<double>& masses) {
    check_sizes(states, masses);
    const std::size_t d = states.empty() ? 0 : states.front().velocity.size();
    std::vector<double> P(d, 0.0);
    for (std::size_t i = 0; i < states.size(); ++i) {
        for (std::size_t k = 0; k < d; ++k) P[k] += masses[i] * states[i].velocity[k];
    }
    return P;
}

std::vector<double> center_of_mass(const std::vector<BodyState>& states, const std::vector<double>& masses) {
    check_sizes(states, masses);
    const std::size_t d = states.empty() ? 0 : states.front().position.size();
    std::vector<double> c(d, 0.0);
    double m_tot = 0.0;
    for (std::size_t i = 0; i < states.size(); ++i) {
        m_tot += masses[i];
        for (std::size_t k = 0; k < d; ++k) c[k] += masses[i] * states[i].position[k];
    }
    if (m_tot > 0.0) {
        for (double& x : c) x /= m_tot;
    }
    return c;
}

Diagnostics compute_diagnostics(const Trajectory& traj, const std::vector<double>& masses, double G) {
    if (masses.size() != traj.names.size()) {
        std::ostringstream os;
        os << "got " << masses.size() << " masses for " << traj.names.size() << " bodies";
        throw ShapeError(os.str());
    }

    Diagnostics out;
    const std::size_t n = traj.t.size();
    out.t = traj.t;
    out.energy.reserve(n);
    out.angular_momentum.reserve(n);
    out.momentum.reserve(n);
    out.center_of_mass.reserve(n);

    for (const auto& states : traj.states) {
        out.energy.push_back(total_energy(states, masses, G));
        out.angular_momentum.push_back(total_angular_momentum(states, masses));
        out.momentum.push_back(total_momentum(states, masses));
        out.center_of_mass.push_back(center_of_mass(states, masses));
    }
    return out;
}

double max_relative_drift(const std::vector<double>& series) {
    if (series.empty()) return 0.0;
    const double x0 = series.front();
    const double scale = (x0 != 0.0) ? std::abs(x0) : 1.0;
    double worst = 0.0;
    for (double x : series) worst = std::max(worst, std::abs(x - x0) / scale);
    return worst;
}

double max_abs_drift(const std::vector<std::vector<double>>& series) {
    if (series.empty()) return 0.0;
    const auto& x0 = series.front();
    double worst = 0.0;
    for (const auto& x : series) {
        double d2 = 0.0;
        for (std::size_t k = 0; k < x.size() && k < x0.size(); ++k) {
            const double d = x[k] - x0[k];
            d2 += d * d;
        }
        worst = std::max(worst, std::sqrt(d2));
    }
    return worst;
}

TwoBodyElements two_body_elements(const std::vector<BodyState>& states, const std::vector<double>& masses, double G) {
    check_sizes(states, masses);
    if (states.size() != 2) {
        throw ValidationError("two_body_elements needs exactly 2 bodies (got " + std::to_string(states.size()) + ")");
    }

    const auto r0 = to3(states[0].position), r1 = to3(states[1].position);
    const auto v0 = to3(states[0].velocity), v1 = to3(states[1].velocity);
    const std::array<double, 3> r{r1[0] - r0[0], r1[1] - r0[1], r1[2] - r0[2]};
    const std::array<double, 3> v{v1[0] - v0[0], v1[1] - v0[1], v1[2] - v0[2]};

    TwoBodyElements el;
    el.mu = G * (masses[0] + masses[1]);
    el.specific_energy = specific_energy(el.mu, r, v);

    const auto h = specific_angular_momentum(r, v);
    el.specific_angular_momentum = std::sqrt(h[0]*h[0] + h[1]*h[1] + h[2]*h[2]);

    const double hh = el.specific_angular_momentum;
    const double e2 = 1.0 + 2.0 * el.specific_energy * hh * hh / (el.mu * el.mu);
    el.eccentricity = std::sqrt(std::max(0.0, e2));

    if (el.specific_energy < 0.0) {
        el.status = OrbitStatus::BOUND;
        el.semi_major_axis = -el.mu / (2.0 * el.specific_energy);
        el.period = 2.0 * kPi * std::sqrt(el.semi_major_axis * el.semi_major_axis * el.semi_major_axis / el.mu);
    } else {
        el.status = OrbitStatus::UNBOUND;
        el.semi_major_axis = std::numeric_limits<double>::infinity();
        el.period = std::numeric_limits<double>::infinity();
    }
    return el;
}

TwoBodyElements two_body_elements(const BodyRegistry& registry, double G) {
    if (registry.size() != 2) {
        throw ValidationError("two_body_elements needs exactly 2 bodies (got " + std::to_string(registry.size()) + ")");
    }
    return two_body_elements(registry.decode_state(registry.encode_initial_state()), registry.masses(), G);
}

} // namespace gravbody
