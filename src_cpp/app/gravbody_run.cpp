// src_cpp/app/gravbody_run.cpp
// Uso: gravbody_run <scenario> [--samples N] [--time-span T] [--out arquivo.csv]
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "gravbody/api.hpp"
#include "gravbody/diagnostics.hpp"
#include "gravbody/errors.hpp"
#include "gravbody/output.hpp"
#include "gravbody/registry.hpp"
#include "gravbody/run_options.hpp"
#include "gravbody/scenarios.hpp"

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <scenario> [--samples N] [--time-span T] [--out file.csv]\n"
              << "scenarios:";
    for (const auto& n : gravbody::scenario_names()) std::cerr << " " << n;
    std::cerr << "\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        usage(argv[0]);
        return 2;
    }

    gravbody::RunOptions opts;
    try {
        opts = gravbody::parse_run_options(std::vector<std::string>(argv + 1, argv + argc));
    } catch (const gravbody::ValidationError& e) {
        std::cerr << e.what() << "\n";
        usage(argv[0]);
        return 2;
    }

    try {
        const gravbody::Scenario sc = gravbody::resolve_scenario(opts);
        const std::string& out_path = opts.out_path;

        const gravbody::BodyRegistry registry(sc.bodies);
        std::cout << sc.title << "\n"
                  << "  bodies=" << registry.size() << " dim=" << registry.dim()
                  << " G=" << sc.sim.G << " time_span=" << sc.sim.time_span
                  << " samples=" << sc.sim.n_samples << "\n";

        const gravbody::Trajectory traj = gravbody::integrate(registry, sc.sim);

        std::cout << "  status=" << gravbody::to_string(traj.status)
                  << " steps=" << traj.stats.n_accepted
                  << " rejected=" << traj.stats.n_rejected
                  << " rhs=" << traj.stats.n_rhs
                  << " switches=" << traj.stats.n_switches << "\n";
        if (traj.status != gravbody::SolveStatus::SUCCESS) {
            std::cerr << "warning: " << traj.message << "\n";
        }

        const gravbody::Diagnostics diag = gravbody::compute_diagnostics(traj, registry.masses(), sc.sim.G);
        std::cout << "  energy drift (rel) = " << gravbody::max_relative_drift(diag.energy) << "\n"
                  << "  momentum drift (abs) = " << gravbody::max_abs_drift(diag.momentum) << "\n";

        gravbody::write_csv(out_path, traj, registry, sc.sim.G);
        std::cout << "CSV output written to " << out_path << "\n";

        return traj.status == gravbody::SolveStatus::SUCCESS ? EXIT_SUCCESS : 3;
    } catch (const gravbody::ValidationError& e) {
        std::cerr << "invalid input: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }
}
