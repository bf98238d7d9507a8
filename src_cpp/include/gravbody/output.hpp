#pragma once
#include <ostream>
#include <string>

#include "gravbody/registry.hpp"
#include "gravbody/types.hpp"

namespace gravbody {

// Uma linha por (amostra, corpo): body,time,x,y,z,vx,vy,vz,mass,energy
// 2D escreve z = vz = 0. energy é a energia total da amostra.
void write_csv(std::ostream& os, const Trajectory& traj, const BodyRegistry& registry, double G);

// std::runtime_error se o arquivo não abre
void write_csv(const std::string& path, const Trajectory& traj, const BodyRegistry& registry, double G);

} // namespace gravbody
