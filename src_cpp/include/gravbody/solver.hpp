#pragma once
#include <functional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "gravbody/types.hpp"

namespace gravbody {

// dy/dt = f(t, y). jacobian é opcional: sem ele, o passo stiff usa diferenças finitas.
struct OdeSystem {
    std::function<void(double, const Eigen::VectorXd&, Eigen::VectorXd&)> rhs;
    std::function<void(double, const Eigen::VectorXd&, Eigen::MatrixXd&)> jacobian;
};

struct OdeSolution {
    std::vector<double> t;
    std::vector<Eigen::VectorXd> y;

    SolveStatus status = SolveStatus::SUCCESS;
    std::string message;
    SolverStats stats;
};

// Integra de times[0] até times.back() e devolve o estado exatamente em cada times[k].
// Passo adaptativo: Dormand-Prince 5(4) enquanto o problema não é stiff,
// Rosenbrock 2(3) linearmente implícito quando a detecção de Hairer dispara (method=AUTO).
// Em falha o resultado é truncado na última amostra válida e status/message explicam o motivo.
// ValidationError: times vazio ou não estritamente crescente, tolerâncias inválidas.
OdeSolution solve_at_times(
    const OdeSystem& sys,
    const Eigen::VectorXd& y0,
    const std::vector<double>& times,
    const SolverCfg& cfg
);

} // namespace gravbody
