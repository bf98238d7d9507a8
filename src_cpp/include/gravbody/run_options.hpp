#pragma once
#include <optional>
#include <string>
#include <vector>

#include "gravbody/scenarios.hpp"

namespace gravbody {

// Argumentos do gravbody_run: <scenario> [--samples N] [--time-span T] [--out arquivo.csv]
struct RunOptions {
    std::string scenario;
    std::optional<int> samples;        // vazio => valor do cenário
    std::optional<double> time_span;
    std::string out_path;              // default: <scenario>.csv
};

// ValidationError: cenário ausente, opção desconhecida, valor faltando ou não numérico.
// Valores fora de faixa passam adiante; quem rejeita é integrate().
RunOptions parse_run_options(const std::vector<std::string>& args);

// Cenário com as opções aplicadas (sem corrigir nada)
Scenario resolve_scenario(const RunOptions& opts);

} // namespace gravbody
