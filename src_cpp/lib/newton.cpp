#include "gravbody/models/newton.hpp"

#include <sstream>

#include "gravbody/errors.hpp"

namespace gravbody {

NewtonGravity::NewtonGravity(const BodyRegistry& registry, double G, double softening)
    : masses_(registry.masses()),
      n_(registry.size()),
      dim_(static_cast<std::size_t>(registry.dim())),
      G_(G),
      eps2_(softening * softening) {
    if (!(G > 0.0) || !std::isfinite(G)) throw ValidationError("G must be > 0 and finite");
    if (!(softening >= 0.0) || !std::isfinite(softening)) {
        throw ValidationError("softening must be >= 0 and finite");
    }
}

std::vector<double> NewtonGravity::derivative(const std::vector<double>& state, double /*t*/) const {
    if (state.size() != state_size()) {
        std::ostringstream os;
        os << "state vector has length " << state.size() << ", expected " << state_size();
        throw ShapeError(os.str());
    }
    std::vector<double> out(state.size());
    rhs(state.data(), out.data());
    return out;
}

void NewtonGravity::rhs(const double* y, double* dydt) const {
    const std::size_t nv = n_ * dim_;

    // Posição | dr/dt = v
    for (std::size_t k = 0; k < nv; ++k) dydt[k] = y[nv + k];

    // Velocidade | dv/dt = a
    accelerations(y, dydt + nv);
}

void NewtonGravity::accelerations(const double* y, double* acc) const {
    const std::size_t nv = n_ * dim_;
    for (std::size_t k = 0; k < nv; ++k) acc[k] = 0.0;

    // pares i<j: cada par calculado uma vez, ação e reação
    for (std::size_t i = 0; i < n_; ++i) {
        const double* ri = y + i * dim_;
        for (std::size_t j = i + 1; j < n_; ++j) {
            const double* rj = y + j * dim_;

            double d[3] = {0.0, 0.0, 0.0};
            double r2 = eps2_;
            for (std::size_t k = 0; k < dim_; ++k) {
                d[k] = rj[k] - ri[k];
                r2 += d[k] * d[k];
            }
            const double r = std::sqrt(r2);
            const double inv_r3 = 1.0 / (r2 * r);

            for (std::size_t k = 0; k < dim_; ++k) {
                acc[i * dim_ + k] += G_ * masses_[j] * d[k] * inv_r3;
                acc[j * dim_ + k] -= G_ * masses_[i] * d[k] * inv_r3;
            }
        }
    }
}

void NewtonGravity::jacobian(const double* y, Eigen::MatrixXd& J) const {
    const Eigen::Index nv = static_cast<Eigen::Index>(n_ * dim_);
    const Eigen::Index d = static_cast<Eigen::Index>(dim_);
    J.setZero(2 * nv, 2 * nv);

    // d(dr/dt)/dv = I
    J.block(0, nv, nv, nv).setIdentity();

    // d a_i / d r_j = G m_j (I/s^3 - 3 dd^T/s^5),  d a_i / d r_i = -sum_j (...)
    for (std::size_t i = 0; i < n_; ++i) {
        const double* ri = y + i * dim_;
        for (std::size_t j = i + 1; j < n_; ++j) {
            const double* rj = y + j * dim_;

            Eigen::Vector3d dv = Eigen::Vector3d::Zero();
            double r2 = eps2_;
            for (std::size_t k = 0; k < dim_; ++k) {
                dv[k] = rj[k] - ri[k];
                r2 += dv[k] * dv[k];
            }
            const double r = std::sqrt(r2);
            const double inv_r3 = 1.0 / (r2 * r);
            const double inv_r5 = inv_r3 / r2;

            const Eigen::MatrixXd K =
                Eigen::MatrixXd::Identity(d, d) * inv_r3
                - 3.0 * inv_r5 * dv.head(d) * dv.head(d).transpose();

            const Eigen::Index ai = nv + static_cast<Eigen::Index>(i) * d;
            const Eigen::Index aj = nv + static_cast<Eigen::Index>(j) * d;
            const Eigen::Index pi = static_cast<Eigen::Index>(i) * d;
            const Eigen::Index pj = static_cast<Eigen::Index>(j) * d;

            J.block(ai, pj, d, d) += G_ * masses_[j] * K;
            J.block(ai, pi, d, d) -= G_ * masses_[j] * K;
            J.block(aj, pi, d, d) += G_ * masses_[i] * K;
            J.block(aj, pj, d, d) -= G_ * masses_[i] * K;
        }
    }
}

} // namespace gravbody
