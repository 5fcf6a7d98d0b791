#include <CLI/CLI.hpp>

#include "stochsim/v1/integrator.hpp"
#include "stochsim/v1/parser/yaml_config.hpp"
#include "stochsim/v1/problems.hpp"
#include "stochsim/v1/step_logger.hpp"
#include "stochsim/v1/validation.hpp"

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

using namespace stochsim::v1;

namespace {

void write_csv(const Solution& solution, std::ostream& out) {
    const Index n = solution.u.size();
    const Index m = solution.W.size();

    out << "t";
    for (Index j = 0; j < n; ++j) out << ",u" << j;
    for (Index j = 0; j < m; ++j) out << ",W" << j;
    out << "\n";

    out << std::scientific << std::setprecision(9);
    if (!solution.has_timeseries()) {
        // Final point only
        out << solution.t;
        for (Index j = 0; j < n; ++j) out << "," << solution.u[j];
        for (Index j = 0; j < m; ++j) out << "," << solution.W[j];
        out << "\n";
        return;
    }

    for (std::size_t i = 0; i < solution.time.size(); ++i) {
        out << solution.time[i];
        for (Index j = 0; j < solution.states[i].size(); ++j) {
            out << "," << solution.states[i][j];
        }
        if (i < solution.wiener.size()) {
            for (Index j = 0; j < solution.wiener[i].size(); ++j) {
                out << "," << solution.wiener[i][j];
            }
        }
        out << "\n";
    }
}

void print_progress(const ProgressInfo& info) {
    const int percent = static_cast<int>(100.0 * info.fraction);
    std::cerr << "\rProgress: " << percent << "% (t=" << std::scientific
              << std::setprecision(3) << info.t << ", dt=" << info.dt << ")" << std::flush;
}

void print_diagnostics(const parser::YamlConfigParser& parser) {
    for (const auto& warning : parser.warnings()) {
        std::cerr << "Warning: " << warning << std::endl;
    }
    for (const auto& error : parser.errors()) {
        std::cerr << "Error: " << error << std::endl;
    }
}

struct RunOverrides {
    std::string output_file;
    std::optional<std::string> algorithm;
    std::optional<double> dt;
    std::optional<double> tstop;
    std::optional<std::uint64_t> seed;
    bool adaptive = false;
    bool step_log = false;
};

int cmd_run(const std::string& run_file, const RunOverrides& overrides, bool verbose, bool quiet) {
    try {
        if (!quiet) {
            std::cerr << "Reading run file: " << run_file << std::endl;
        }

        parser::YamlConfigParser parser;
        parser::RunConfig config = parser.load(run_file);
        print_diagnostics(parser);
        if (!parser.errors().empty()) {
            return 1;
        }

        SolveOptions& opts = config.options;
        if (overrides.algorithm) {
            const auto algorithm = parse_algorithm(*overrides.algorithm);
            if (!algorithm) {
                std::cerr << "Error: unknown algorithm '" << *overrides.algorithm << "'" << std::endl;
                return 1;
            }
            opts.algorithm = *algorithm;
        }
        if (overrides.dt) opts.dt = *overrides.dt;
        if (overrides.tstop) config.time_span[1] = *overrides.tstop;
        if (overrides.seed) opts.seed = *overrides.seed;
        if (overrides.adaptive) opts.adaptive = true;

        auto problem = config.build_problem();
        if (!problem) {
            std::cerr << "Error: " << problem.error() << std::endl;
            return 1;
        }

        if (verbose) {
            std::cerr << "Problem loaded:" << std::endl;
            std::cerr << "  Name: " << problem->name << std::endl;
            std::cerr << "  Dimension: " << problem->dimension() << std::endl;
            std::cerr << "  Noise: " << (problem->has_jumps() ? "jumps" : to_string(problem->noise.kind))
                      << std::endl;
        }

        if (!quiet) {
            std::cerr << "Integrating..." << std::endl;
            std::cerr << "  algorithm: " << to_string(opts.algorithm) << std::endl;
            std::cerr << "  tspan: [" << config.time_span[0] << ", " << config.time_span[1] << "]" << std::endl;
            std::cerr << "  dt: " << (opts.dt > 0.0 ? std::to_string(opts.dt) : std::string("auto")) << std::endl;
            std::cerr << "  adaptive: " << (opts.adaptive ? "true" : "false") << std::endl;
            opts.progress = print_progress;
        }

        StepLogger logger;
        if (overrides.step_log) {
            logger.set_enabled(true);
            opts.step_logger = &logger;
        }

        const Solution solution = solve(*problem, config.time_span, opts);
        if (!quiet) {
            std::cerr << std::endl;
        }

        if (!solution.success()) {
            std::cerr << "Integration failed (" << to_string(solution.status) << "): "
                      << solution.message << std::endl;
            std::cerr << "  Stopped at t=" << solution.t << " after "
                      << solution.accepted_steps << " accepted steps" << std::endl;
            return 1;
        }

        if (!quiet) {
            std::cerr << "Integration completed:" << std::endl;
            std::cerr << "  Accepted steps: " << solution.accepted_steps << std::endl;
            std::cerr << "  Rejected steps: " << solution.rejected_steps << std::endl;
            std::cerr << "  Wall time: " << std::fixed << std::setprecision(3)
                      << solution.wall_time_seconds << "s" << std::endl;
            if (solution.has_analytic()) {
                const auto comparison = compare_with_analytic(solution, problem->name);
                std::cerr << "  Analytic max error: " << std::scientific << std::setprecision(3)
                          << comparison.max_error << std::endl;
            }
        }

        if (overrides.step_log && verbose) {
            std::cerr << "Step log: " << logger.total_entries() << " attempts, rejection rate "
                      << logger.rejection_rate() << ", max error " << logger.max_error() << std::endl;
        }

        const std::string output_file =
            !overrides.output_file.empty() ? overrides.output_file : config.output_path.value_or("");
        if (!output_file.empty()) {
            if (!quiet) {
                std::cerr << "Writing results to: " << output_file << std::endl;
            }
            std::ofstream file(output_file);
            if (!file.is_open()) {
                throw std::runtime_error("Cannot open output file: " + output_file);
            }
            write_csv(solution, file);
        } else {
            write_csv(solution, std::cout);
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_validate(const std::string& run_file, bool verbose) {
    try {
        parser::YamlConfigParser parser;
        const parser::RunConfig config = parser.load(run_file);
        print_diagnostics(parser);
        if (!parser.errors().empty()) {
            return 1;
        }

        auto problem = config.build_problem();
        if (!problem) {
            std::cerr << "Validation failed: " << problem.error() << std::endl;
            return 1;
        }
        if (const auto issue = validate_solve_inputs(*problem, config.time_span, config.options)) {
            std::cerr << "Validation failed: " << issue->message << std::endl;
            return 1;
        }
        if (auto kernel = make_step_kernel(config.options, *problem); !kernel) {
            std::cerr << "Validation failed (" << to_string(kernel.error().status) << "): "
                      << kernel.error().message << std::endl;
            return 1;
        }

        if (verbose) {
            std::cout << "Run file is valid." << std::endl;
            std::cout << "  Problem: " << config.problem_name << std::endl;
            std::cout << "  Dimension: " << problem->dimension() << std::endl;
            std::cout << "  Algorithm: " << to_string(config.options.algorithm) << std::endl;
            std::cout << "  Adaptive: " << (config.options.adaptive ? "true" : "false") << std::endl;
        } else {
            std::cout << "OK" << std::endl;
        }
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

int cmd_info() {
    std::cout << "Algorithms:" << std::endl;
    for (Algorithm algorithm : kAllAlgorithms) {
        std::cout << "  " << to_string(algorithm)
                  << (is_adaptive_capable(algorithm) ? "" : " (fixed step only)") << std::endl;
    }

    std::cout << "\nProblems:" << std::endl;
    for (const auto& info : problem_catalogue()) {
        std::cout << "  " << info.name << ": " << info.description << std::endl;
        std::cout << "    dimension " << info.u0.size()
                  << (info.fixed_dimension ? "" : " (any)")
                  << ", suggested " << to_string(info.suggested_algorithm)
                  << (info.has_analytic ? ", analytic solution" : "") << std::endl;
        for (const auto& [name, value] : info.defaults) {
            std::cout << "    " << name << " = " << value << std::endl;
        }
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    CLI::App app{"stochsim - Adaptive stochastic differential equation integrator"};
    app.set_version_flag("-V,--version", "stochsim 0.1.0");

    // Global options
    bool verbose = false;
    bool quiet = false;
    app.add_flag("-v,--verbose", verbose, "Verbose output");
    app.add_flag("-q,--quiet", quiet, "Quiet mode (errors only)");

    // Run command
    auto* run_cmd = app.add_subcommand("run", "Integrate the problem described by a run file");
    std::string run_file;
    RunOverrides overrides;

    run_cmd->add_option("file", run_file, "Run file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    run_cmd->add_option("-o,--output", overrides.output_file, "Output file (CSV)");
    run_cmd->add_option("--algorithm", overrides.algorithm, "Algorithm name (overrides YAML)");
    run_cmd->add_option("--dt", overrides.dt, "Step size (overrides YAML)");
    run_cmd->add_option("--tstop", overrides.tstop, "End time (overrides YAML)");
    run_cmd->add_option("--seed", overrides.seed, "Noise seed (overrides YAML)");
    run_cmd->add_flag("--adaptive", overrides.adaptive, "Enable adaptive stepping");
    run_cmd->add_flag("--step-log", overrides.step_log, "Record every attempted step");

    run_cmd->callback([&]() {
        std::exit(cmd_run(run_file, overrides, verbose, quiet));
    });

    // Validate command
    auto* validate_cmd = app.add_subcommand("validate", "Validate a run file");
    std::string validate_file;
    validate_cmd->add_option("file", validate_file, "Run file (YAML)")
        ->required()
        ->check(CLI::ExistingFile);
    validate_cmd->callback([&]() {
        std::exit(cmd_validate(validate_file, verbose));
    });

    // Info command
    auto* info_cmd = app.add_subcommand("info", "List algorithms and built-in problems");
    info_cmd->callback([&]() {
        std::exit(cmd_info());
    });

    app.require_subcommand(1);

    CLI11_PARSE(app, argc, argv);

    return 0;
}
