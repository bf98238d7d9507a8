#pragma once
#include <cstdint>
#include <vector>

#include "gravbody/registry.hpp"
#include "gravbody/types.hpp"

namespace gravbody {

enum class OrbitStatus : std::uint8_t {
    BOUND = 0,
    UNBOUND = 1
};

// Séries por amostra. L: 2D => {Lz}, 3D => {Lx,Ly,Lz}.
struct Diagnostics {
    std::vector<double> t;
    std::vector<double> energy;
    std::vector<std::vector<double>> angular_momentum;
    std::vector<std::vector<double>> momentum;
    std::vector<std::vector<double>> center_of_mass;
};

// Órbita relativa do problema de 2 corpos (corpo 1 em torno do corpo 0)
struct TwoBodyElements {
    double mu = 0.0;                // G (m0 + m1)
    double specific_energy = 0.0;   // v^2/2 - mu/r
    double specific_angular_momentum = 0.0; // |r x v|
    double eccentricity = 0.0;
    double semi_major_axis = 0.0;   // inf se não ligado
    double period = 0.0;            // inf se não ligado
    OrbitStatus status = OrbitStatus::BOUND;
};

// E = sum 1/2 m v^2 - sum_{i<j} G m_i m_j / |r_i - r_j|
double total_energy(const std::vector<BodyState>& states, const std::vector<double>& masses, double G);
std::vector<double> total_angular_momentum(const std::vector<BodyState>& states, const std::vector<double>& masses);
std::vector<double> total_momentum(const std::vector<BodyState>& states, const std::vector<double>& masses);
std::vector<double> center_of_mass(const std::vector<BodyState>& states, const std::vector<double>& masses);

// ShapeError se masses não bate com o número de corpos da trajetória
Diagnostics compute_diagnostics(const Trajectory& traj, const std::vector<double>& masses, double G);

// max_k |x_k - x_0| / |x_0| (ou absoluto se x_0 == 0)
double max_relative_drift(const std::vector<double>& series);

// max_k ||x_k - x_0||
double max_abs_drift(const std::vector<std::vector<double>>& series);

// ValidationError se o registry não tem exatamente 2 corpos
TwoBodyElements two_body_elements(const BodyRegistry& registry, double G);
TwoBodyElements two_body_elements(const std::vector<BodyState>& states, const std::vector<double>& masses, double G);

} // namespace gravbody
