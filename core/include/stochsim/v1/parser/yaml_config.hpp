#pragma once

#include "stochsim/v1/options.hpp"
#include "stochsim/v1/problem.hpp"
#include "stochsim/v1/problems.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace stochsim::v1::parser {

struct YamlConfigOptions {
    bool strict = true;              // Fail on unknown fields
};

/// Everything a run file describes
struct RunConfig {
    std::string problem_name;
    ProblemParameters parameters;
    std::optional<Vector> u0;
    std::vector<Real> time_span{0.0, 1.0};
    SolveOptions options;
    std::optional<std::string> output_path;

    /// Catalogue problem with the configured parameters and initial state
    [[nodiscard]] std::expected<SDEProblem, std::string> build_problem() const {
        return make_problem(problem_name, parameters, u0);
    }
};

class YamlConfigParser {
public:
    explicit YamlConfigParser(YamlConfigOptions options = {});

    // Parse from file
    RunConfig load(const std::filesystem::path& path);

    // Parse from string
    RunConfig load_string(const std::string& content);

    const std::vector<std::string>& errors() const { return errors_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    YamlConfigOptions options_;
    std::vector<std::string> errors_;
    std::vector<std::string> warnings_;

    void parse_yaml(const std::string& content, RunConfig& config);
};

}  // namespace stochsim::v1::parser
