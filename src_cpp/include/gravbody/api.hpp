#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "gravbody/registry.hpp"
#include "gravbody/types.hpp"

namespace gravbody {

// Core: integra o sistema de N corpos em n_samples tempos igualmente espaçados em [0, time_span].
// ValidationError para parâmetros inválidos (antes de qualquer integração).
// Falha do solver não lança: trajetória truncada + status/message.
Trajectory integrate(
    const BodyRegistry& registry,
    const SimulationCfg& sim,
    const SolverCfg& cfg = SolverCfg{}
);

// Wrapper: mesma coisa com os parâmetros soltos
Trajectory integrate(
    const BodyRegistry& registry,
    double G,
    double time_span,
    int n_samples
);

// linspace(0, time_span, n_samples); último elemento exatamente time_span
std::vector<double> sample_times(double time_span, int n_samples);

// Lança IntegrationError se a trajetória não cobre todo o intervalo
void require_complete(const Trajectory& traj);

// coluna do corpo na trajetória; ValidationError se o nome não existe
std::size_t find_body(const Trajectory& traj, const std::string& name);

const char* to_string(SolveStatus status);

} // namespace gravbody
