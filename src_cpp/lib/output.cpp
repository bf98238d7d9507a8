#include "gravbody/output.hpp"

#include <fstream>
#include <iomanip>
#include <stdexcept>

#include "gravbody/api.hpp"
#include "gravbody/diagnostics.hpp"
#include "gravbody/errors.hpp"

namespace gravbody {

void write_csv(std::ostream& os, const Trajectory& traj, const BodyRegistry& registry, double G) {
    if (traj.names != registry.names()) {
        throw ShapeError("trajectory bodies do not match the registry");
    }
    const std::vector<double> masses = registry.masses();
    const std::streamsize old_precision = os.precision();

    // metadados
    os << "# status=" << to_string(traj.status) << " dim=" << traj.dim
       << " samples=" << traj.t.size() << "\n";
    os << "body,time,x,y,z,vx,vy,vz,mass,energy\n";

    for (std::size_t k = 0; k < traj.t.size(); ++k) {
        const auto& states = traj.states[k];
        const double energy = total_energy(states, masses, G);

        for (std::size_t i = 0; i < states.size(); ++i) {
            const auto& r = states[i].position;
            const auto& v = states[i].velocity;
            const double z = (r.size() > 2) ? r[2] : 0.0;
            const double vz = (v.size() > 2) ? v[2] : 0.0;

            os << traj.names[i] << ","
               << std::setprecision(10) << traj.t[k] << ","
               << std::setprecision(15)
               << r[0] << "," << r[1] << "," << z << ","
               << v[0] << "," << v[1] << "," << vz << ","
               << masses[i] << ","
               << energy << "\n";
        }
    }
    os.precision(old_precision);
}

void write_csv(const std::string& path, const Trajectory& traj, const BodyRegistry& registry, double G) {
    std::ofstream out(path);
    if (!out) throw std::runtime_error("could not open '" + path + "' for writing");
    write_csv(out, traj, registry, G);
    if (!out) throw std::runtime_error("error while writing '" + path + "'");
}

} // namespace gravbody
