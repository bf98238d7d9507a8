#pragma once
#include <string>
#include <vector>

#include "gravbody/types.hpp"

namespace gravbody {

// Condições iniciais prontas (mesmos números dos scripts de plot)
struct Scenario {
    std::string name;
    std::string title;
    std::vector<BodyDescriptor> bodies;
    SimulationCfg sim;
};

std::vector<std::string> scenario_names();

// ValidationError para nome desconhecido
Scenario make_scenario(const std::string& name);

} // namespace gravbody
