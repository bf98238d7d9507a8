#pragma once
#include <array>
#include <cmath>
#include <cstddef>
#include <vector>

#include <Eigen/Dense>

#include "gravbody/registry.hpp"

namespace gravbody {

// RHS do problema de N corpos: state = [r_0..r_{N-1}, v_0..v_{N-1}]
//   dr_i/dt = v_i
//   dv_i/dt = sum_{j!=i} G m_j (r_j - r_i) / (|r_j - r_i|^2 + eps^2)^{3/2}
// Distância zero com eps=0 gera inf/NaN de propósito; quem decide é o solver.
class NewtonGravity {
public:
    NewtonGravity(const BodyRegistry& registry, double G, double softening = 0.0);

    std::size_t state_size() const { return 2 * n_ * dim_; }

    // versão checada (ShapeError); t não é usado, o campo é autônomo
    std::vector<double> derivative(const std::vector<double>& state, double t) const;

    // caminho quente usado pelo solver (sem checagem de tamanho)
    void rhs(const double* y, double* dydt) const;

    // aceleração de cada corpo, [a_0..a_{N-1}]
    void accelerations(const double* y, double* acc) const;

    // J = df/dy (2Nd x 2Nd)
    void jacobian(const double* y, Eigen::MatrixXd& J) const;

    double softening() const { return std::sqrt(eps2_); }

private:
    std::vector<double> masses_;
    std::size_t n_ = 0;
    std::size_t dim_ = 0;
    double G_ = 0.0;
    double eps2_ = 0.0;
};

// Problema de 2 corpos reduzido (movimento relativo): mu = G (m1 + m2)
inline double specific_energy(double mu, const std::array<double, 3>& r, const std::array<double, 3>& v) {
    const double rr = std::sqrt(r[0]*r[0] + r[1]*r[1] + r[2]*r[2]);
    const double v2 = v[0]*v[0] + v[1]*v[1] + v[2]*v[2];
    return 5.0e-1 * v2 - mu / rr;
}

inline std::array<double, 3> specific_angular_momentum(const std::array<double, 3>& r, const std::array<double, 3>& v) {
    return {
        r[1]*v[2] - r[2]*v[1],
        r[2]*v[0] - r[0]*v[2],
        r[0]*v[1] - r[1]*v[0]
    };
}

} // namespace gravbody
