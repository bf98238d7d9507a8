#include "gravbody/run_options.hpp"

#include <cstddef>
#include <stdexcept>

#include "gravbody/errors.hpp"

namespace gravbody {

// número inteiro do texto, sem sobras ("12abc" é erro)
static int parse_int(const std::string& flag, const std::string& text) {
    std::size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::logic_error&) {
        throw ValidationError("invalid value '" + text + "' for " + flag);
    }
    if (pos != text.size()) throw ValidationError("invalid value '" + text + "' for " + flag);
    return value;
}

static double parse_double(const std::string& flag, const std::string& text) {
    std::size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::logic_error&) {
        throw ValidationError("invalid value '" + text + "' for " + flag);
    }
    if (pos != text.size()) throw ValidationError("invalid value '" + text + "' for " + flag);
    return value;
}

RunOptions parse_run_options(const std::vector<std::string>& args) {
    if (args.empty() || args.front().empty() || args.front().rfind("--", 0) == 0) {
        throw ValidationError("missing scenario name");
    }

    RunOptions opts;
    opts.scenario = args.front();
    opts.out_path = opts.scenario + ".csv";

    for (std::size_t i = 1; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (flag != "--samples" && flag != "--time-span" && flag != "--out") {
            throw ValidationError("unknown option " + flag);
        }
        if (i + 1 >= args.size()) throw ValidationError("missing value for " + flag);
        const std::string& val = args[++i];

        if (flag == "--samples") opts.samples = parse_int(flag, val);
        else if (flag == "--time-span") opts.time_span = parse_double(flag, val);
        else opts.out_path = val;
    }
    return opts;
}

Scenario resolve_scenario(const RunOptions& opts) {
    Scenario sc = make_scenario(opts.scenario);
    if (opts.samples) sc.sim.n_samples = *opts.samples;
    if (opts.time_span) sc.sim.time_span = *opts.time_span;
    return sc;
}

} // namespace gravbody
