#include "stochsim/v1/parser/yaml_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace stochsim::v1::parser {

namespace {

constexpr const char* kSchemaId = "stochsim-v1";
constexpr const char* kDiagUnknownField = "STOCHSIM_YAML_E_UNKNOWN_FIELD";
constexpr const char* kDiagTypeMismatch = "STOCHSIM_YAML_E_TYPE_MISMATCH";
constexpr const char* kDiagInvalidAlgorithm = "STOCHSIM_YAML_E_ALGORITHM_INVALID";
constexpr const char* kDiagUnsupportedProblem = "STOCHSIM_YAML_E_PROBLEM_UNSUPPORTED";
constexpr const char* kDiagInvalidParameter = "STOCHSIM_YAML_E_PARAM_INVALID";
constexpr const char* kDiagInvalidTableau = "STOCHSIM_YAML_E_TABLEAU_INVALID";
constexpr const char* kDiagIgnoredField = "STOCHSIM_YAML_W_FIELD_IGNORED";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string with_diag_code(const std::string& code, const std::string& message) {
    return "[" + code + "] " + message;
}

void push_error(std::vector<std::string>& errors, const std::string& code, const std::string& message) {
    errors.push_back(with_diag_code(code, message));
}

void push_warning(std::vector<std::string>& warnings, const std::string& code, const std::string& message) {
    warnings.push_back(with_diag_code(code, message));
}

std::string yaml_node_class(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return "null";
    }
    if (node.IsScalar()) {
        return "scalar";
    }
    if (node.IsSequence()) {
        return "sequence";
    }
    if (node.IsMap()) {
        return "map";
    }
    return "unknown";
}

void push_type_mismatch_error(std::vector<std::string>& errors,
                              const std::string& path,
                              const std::string& expected,
                              const YAML::Node& received) {
    push_error(
        errors,
        kDiagTypeMismatch,
        "Type mismatch at '" + path + "' (expected " + expected +
            ", got " + yaml_node_class(received) + ")");
}

void validate_keys(const YAML::Node& node,
                   const std::unordered_set<std::string>& allowed,
                   const std::string& context,
                   std::vector<std::string>& errors,
                   bool strict) {
    if (!strict || !node || !node.IsMap()) return;
    for (const auto& it : node) {
        const std::string key = it.first.as<std::string>();
        if (allowed.find(key) == allowed.end()) {
            push_error(errors,
                       kDiagUnknownField,
                       "Unknown field at '" + context + "." + key + "'");
        }
    }
}

// =============================================================================
// Scalar Parsing
// =============================================================================

/// Number with an optional engineering suffix ("2m" = 2e-3, "1meg" = 1e6)
Real parse_real_string(const std::string& raw) {
    if (raw.empty()) {
        throw std::invalid_argument("empty numeric value");
    }

    char* end = nullptr;
    const double base = std::strtod(raw.c_str(), &end);
    if (end == raw.c_str()) {
        throw std::invalid_argument("invalid numeric value");
    }

    std::string suffix = raw.substr(static_cast<std::size_t>(end - raw.c_str()));
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!suffix.empty() && is_space(static_cast<unsigned char>(suffix.front()))) {
        suffix.erase(suffix.begin());
    }
    while (!suffix.empty() && is_space(static_cast<unsigned char>(suffix.back()))) {
        suffix.pop_back();
    }
    if (suffix.empty()) return base;

    const std::string lower = to_lower(suffix);
    auto starts_with = [&](const std::string& prefix) {
        return lower.rfind(prefix, 0) == 0;
    };

    double multiplier = 1.0;
    if (starts_with("meg") || suffix.front() == 'M') {
        multiplier = 1e6;
    } else if (starts_with("k")) {
        multiplier = 1e3;
    } else if (starts_with("milli") || starts_with("m")) {
        multiplier = 1e-3;
    } else if (starts_with("micro") || starts_with("u")) {
        multiplier = 1e-6;
    } else if (starts_with("nano") || starts_with("n")) {
        multiplier = 1e-9;
    } else if (starts_with("pico") || starts_with("p")) {
        multiplier = 1e-12;
    } else if (starts_with("femto") || starts_with("f")) {
        multiplier = 1e-15;
    } else {
        throw std::invalid_argument("unknown numeric suffix '" + suffix + "'");
    }

    return base * multiplier;
}

std::optional<Real> parse_real(const YAML::Node& node,
                               const std::string& path,
                               std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }
    try {
        return parse_real_string(node.as<std::string>());
    } catch (const std::exception&) {
        push_type_mismatch_error(errors, path, "number", node);
        return std::nullopt;
    }
}

std::optional<bool> parse_bool_scalar(const YAML::Node& node,
                                      const std::string& path,
                                      std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "boolean", node);
        return std::nullopt;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "boolean", node);
        return std::nullopt;
    }
}

std::optional<int> parse_int_scalar(const YAML::Node& node,
                                    const std::string& path,
                                    std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
    try {
        return node.as<int>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "integer", node);
        return std::nullopt;
    }
}

std::optional<std::string> parse_string_scalar(const YAML::Node& node,
                                               const std::string& path,
                                               std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsScalar()) {
        push_type_mismatch_error(errors, path, "string", node);
        return std::nullopt;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        push_type_mismatch_error(errors, path, "string", node);
        return std::nullopt;
    }
}

/// Non-negative whole number; accepts scientific notation such as 1e9
std::optional<std::uint64_t> parse_count(const YAML::Node& node,
                                         const std::string& path,
                                         std::vector<std::string>& errors) {
    const auto value = parse_real(node, path, errors);
    if (!value) {
        return std::nullopt;
    }
    if (!std::isfinite(*value) || *value < 0.0 || std::floor(*value) != *value ||
        *value > static_cast<Real>(std::numeric_limits<std::uint64_t>::max())) {
        push_error(errors, kDiagInvalidParameter,
                   "'" + path + "' must be a non-negative integer");
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(*value);
}

/// Scalar or sequence of numbers
std::optional<Vector> parse_vector(const YAML::Node& node,
                                   const std::string& path,
                                   std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (node.IsScalar()) {
        const auto value = parse_real(node, path, errors);
        if (!value) return std::nullopt;
        return Vector::Constant(1, *value);
    }
    if (!node.IsSequence()) {
        push_type_mismatch_error(errors, path, "number or sequence", node);
        return std::nullopt;
    }

    Vector out(static_cast<Index>(node.size()));
    for (std::size_t i = 0; i < node.size(); ++i) {
        const auto value = parse_real(node[i], path + "[" + std::to_string(i) + "]", errors);
        if (!value) return std::nullopt;
        out[static_cast<Index>(i)] = *value;
    }
    return out;
}

/// Sequence of equal-length rows
std::optional<Matrix> parse_matrix(const YAML::Node& node,
                                   const std::string& path,
                                   std::vector<std::string>& errors) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.IsSequence()) {
        push_type_mismatch_error(errors, path, "sequence of rows", node);
        return std::nullopt;
    }

    const auto rows = static_cast<Index>(node.size());
    Matrix out;
    for (Index i = 0; i < rows; ++i) {
        const std::string row_path = path + "[" + std::to_string(i) + "]";
        const auto row = parse_vector(node[static_cast<std::size_t>(i)], row_path, errors);
        if (!row) return std::nullopt;
        if (i == 0) {
            out = Matrix::Zero(rows, row->size());
        } else if (row->size() != out.cols()) {
            push_error(errors, kDiagInvalidTableau, "Row length mismatch at '" + row_path + "'");
            return std::nullopt;
        }
        out.row(i) = row->transpose();
    }
    return out;
}

// =============================================================================
// Tableau Parsing
// =============================================================================

std::optional<Tableau> parse_tableau(const YAML::Node& node,
                                     std::vector<std::string>& errors,
                                     bool strict) {
    const std::string path = "simulation.tableau";
    if (node.IsScalar()) {
        const auto name = parse_string_scalar(node, path, errors);
        if (!name) return std::nullopt;
        if (*name == "SRIW1") return Tableau{construct_sriw1()};
        if (*name == "SRA1") return Tableau{construct_sra1()};
        push_error(errors, kDiagInvalidTableau, "Unknown tableau '" + *name + "' (expected SRIW1 or SRA1)");
        return std::nullopt;
    }
    if (!node.IsMap()) {
        push_type_mismatch_error(errors, path, "tableau name or map", node);
        return std::nullopt;
    }

    const auto family = parse_string_scalar(node["family"], path + ".family", errors);
    if (!family) {
        push_error(errors, kDiagInvalidTableau, "Custom tableau needs 'family: sri|sra'");
        return std::nullopt;
    }

    const std::size_t errors_before = errors.size();
    auto vec = [&](const char* key) {
        const auto v = parse_vector(node[key], path + "." + key, errors);
        if (!v && node[key].IsDefined() == false) {
            push_error(errors, kDiagInvalidTableau, "Missing tableau field '" + path + "." + key + "'");
        }
        return v.value_or(Vector{});
    };
    auto mat = [&](const char* key) {
        const auto m = parse_matrix(node[key], path + "." + key, errors);
        if (!m && node[key].IsDefined() == false) {
            push_error(errors, kDiagInvalidTableau, "Missing tableau field '" + path + "." + key + "'");
        }
        return m.value_or(Matrix{});
    };

    const std::string name = parse_string_scalar(node["name"], path + ".name", errors).value_or("custom");
    const Real order = parse_real(node["order"], path + ".order", errors).value_or(1.0);

    if (to_lower(*family) == "sri") {
        validate_keys(node, {"family", "name", "order", "c0", "c1", "A0", "A1", "B0", "B1",
                             "alpha", "beta1", "beta2", "beta3", "beta4"},
                      path, errors, strict);
        SRITableau t;
        t.name = name;
        t.order = order;
        t.c0 = vec("c0");
        t.c1 = vec("c1");
        t.A0 = mat("A0");
        t.A1 = mat("A1");
        t.B0 = mat("B0");
        t.B1 = mat("B1");
        t.alpha = vec("alpha");
        t.beta1 = vec("beta1");
        t.beta2 = vec("beta2");
        t.beta3 = vec("beta3");
        t.beta4 = vec("beta4");
        if (errors.size() != errors_before) return std::nullopt;
        return Tableau{std::move(t)};
    }
    if (to_lower(*family) == "sra") {
        validate_keys(node, {"family", "name", "order", "c0", "c1", "A0", "B0", "alpha", "beta1", "beta2"},
                      path, errors, strict);
        SRATableau t;
        t.name = name;
        t.order = order;
        t.c0 = vec("c0");
        t.c1 = vec("c1");
        t.A0 = mat("A0");
        t.B0 = mat("B0");
        t.alpha = vec("alpha");
        t.beta1 = vec("beta1");
        t.beta2 = vec("beta2");
        if (errors.size() != errors_before) return std::nullopt;
        return Tableau{std::move(t)};
    }

    push_error(errors, kDiagInvalidTableau, "Unknown tableau family '" + *family + "' (expected sri or sra)");
    return std::nullopt;
}

}  // namespace

// =============================================================================
// YamlConfigParser
// =============================================================================

YamlConfigParser::YamlConfigParser(YamlConfigOptions options)
    : options_(options) {}

RunConfig YamlConfigParser::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        errors_.clear();
        warnings_.clear();
        errors_.push_back("Cannot open file: " + path.string());
        return RunConfig{};
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return load_string(buffer.str());
}

RunConfig YamlConfigParser::load_string(const std::string& content) {
    RunConfig config;
    errors_.clear();
    warnings_.clear();

    parse_yaml(content, config);
    return config;
}

void YamlConfigParser::parse_yaml(const std::string& content, RunConfig& config) {
    YAML::Node root;
    try {
        root = YAML::Load(content);
    } catch (const YAML::Exception& e) {
        errors_.push_back(std::string("YAML parse error: ") + e.what());
        return;
    }

    if (!root || !root.IsMap()) {
        errors_.push_back("Run file must be a YAML map");
        return;
    }

    validate_keys(root, {"schema", "version", "problem", "simulation", "output"},
                  "root", errors_, options_.strict);

    if (!root["schema"]) {
        errors_.push_back("Missing required field 'schema'");
        return;
    }
    if (!root["version"]) {
        errors_.push_back("Missing required field 'version'");
        return;
    }

    const std::optional<std::string> schema = parse_string_scalar(root["schema"], "root.schema", errors_);
    if (!schema) {
        return;
    }
    if (*schema != kSchemaId) {
        errors_.push_back("Unsupported schema: " + *schema);
        return;
    }

    const std::optional<int> version = parse_int_scalar(root["version"], "root.version", errors_);
    if (!version) {
        return;
    }
    if (*version != 1) {
        errors_.push_back("Unsupported schema version: " + std::to_string(*version));
        return;
    }

    // Problem
    const YAML::Node problem = root["problem"];
    if (!problem) {
        errors_.push_back("Missing required section 'problem'");
        return;
    }
    if (!problem.IsMap()) {
        push_type_mismatch_error(errors_, "problem", "map", problem);
        return;
    }
    validate_keys(problem, {"name", "parameters", "u0"}, "problem", errors_, options_.strict);

    if (const auto name = parse_string_scalar(problem["name"], "problem.name", errors_)) {
        config.problem_name = *name;
        if (find_problem(*name) == nullptr) {
            push_error(errors_, kDiagUnsupportedProblem, "Unknown problem '" + *name + "'");
        }
    } else if (!problem["name"]) {
        errors_.push_back("Missing required field 'problem.name'");
    }

    if (const YAML::Node params = problem["parameters"]) {
        if (!params.IsMap()) {
            push_type_mismatch_error(errors_, "problem.parameters", "map", params);
        } else {
            const ProblemInfo* info = find_problem(config.problem_name);
            for (const auto& it : params) {
                const std::string key = it.first.as<std::string>();
                const std::string path = "problem.parameters." + key;
                if (info != nullptr && !info->defaults.contains(key)) {
                    push_error(errors_, kDiagInvalidParameter,
                               "Problem '" + info->name + "' has no parameter '" + key + "'");
                    continue;
                }
                if (const auto value = parse_real(it.second, path, errors_)) {
                    config.parameters[key] = *value;
                }
            }
        }
    }

    config.u0 = parse_vector(problem["u0"], "problem.u0", errors_);

    // Simulation
    if (const YAML::Node sim = root["simulation"]) {
        if (!sim.IsMap()) {
            push_type_mismatch_error(errors_, "simulation", "map", sim);
            return;
        }
        validate_keys(sim, {"tstart", "tstop", "dt", "algorithm", "adaptive", "abstol", "reltol",
                            "gamma", "qmin", "qmax", "delta", "beta_p", "maxiters", "dtmin", "dtmax",
                            "internalnorm", "discard_length", "adaptive_controller", "tableau",
                            "save_timeseries", "timeseries_steps", "progress_steps", "seed"},
                      "simulation", errors_, options_.strict);

        SolveOptions& opts = config.options;
        if (const auto v = parse_real(sim["tstart"], "simulation.tstart", errors_)) config.time_span[0] = *v;
        if (const auto v = parse_real(sim["tstop"], "simulation.tstop", errors_)) config.time_span[1] = *v;
        if (const auto v = parse_real(sim["dt"], "simulation.dt", errors_)) opts.dt = *v;
        if (const auto v = parse_real(sim["abstol"], "simulation.abstol", errors_)) opts.abstol = *v;
        if (const auto v = parse_real(sim["reltol"], "simulation.reltol", errors_)) opts.reltol = *v;
        if (const auto v = parse_real(sim["gamma"], "simulation.gamma", errors_)) opts.gamma = *v;
        if (const auto v = parse_real(sim["qmin"], "simulation.qmin", errors_)) opts.qmin = *v;
        if (const auto v = parse_real(sim["qmax"], "simulation.qmax", errors_)) opts.qmax = *v;
        if (const auto v = parse_real(sim["delta"], "simulation.delta", errors_)) opts.delta = *v;
        if (const auto v = parse_real(sim["beta_p"], "simulation.beta_p", errors_)) opts.beta_p = *v;
        if (const auto v = parse_real(sim["dtmin"], "simulation.dtmin", errors_)) opts.dtmin = *v;
        if (const auto v = parse_real(sim["dtmax"], "simulation.dtmax", errors_)) opts.dtmax = *v;
        if (const auto v = parse_real(sim["internalnorm"], "simulation.internalnorm", errors_)) {
            opts.internalnorm = *v;
        }
        if (const auto v = parse_real(sim["discard_length"], "simulation.discard_length", errors_)) {
            opts.discard_length = *v;
        }
        if (const auto v = parse_bool_scalar(sim["adaptive"], "simulation.adaptive", errors_)) opts.adaptive = *v;
        if (const auto v = parse_bool_scalar(sim["save_timeseries"], "simulation.save_timeseries", errors_)) {
            opts.save_timeseries = *v;
        }
        if (const auto v = parse_count(sim["maxiters"], "simulation.maxiters", errors_)) {
            opts.maxiters = static_cast<std::size_t>(*v);
        }
        if (const auto v = parse_count(sim["timeseries_steps"], "simulation.timeseries_steps", errors_)) {
            opts.timeseries_steps = static_cast<std::size_t>(*v);
        }
        if (const auto v = parse_count(sim["progress_steps"], "simulation.progress_steps", errors_)) {
            opts.progress_steps = static_cast<std::size_t>(*v);
        }
        if (const auto v = parse_count(sim["seed"], "simulation.seed", errors_)) opts.seed = *v;

        if (const auto name = parse_string_scalar(sim["algorithm"], "simulation.algorithm", errors_)) {
            if (const auto algorithm = parse_algorithm(*name)) {
                opts.algorithm = *algorithm;
            } else {
                push_error(errors_, kDiagInvalidAlgorithm, "Unknown algorithm '" + *name + "'");
            }
        }
        if (const auto name = parse_string_scalar(sim["adaptive_controller"],
                                                  "simulation.adaptive_controller", errors_)) {
            if (const auto controller = parse_adaptive_controller(*name)) {
                opts.adaptive_controller = *controller;
            } else {
                push_error(errors_, kDiagInvalidParameter,
                           "Unknown adaptive controller '" + *name + "' (expected RSwM3 or PI)");
            }
        }
        if (const YAML::Node tableau = sim["tableau"]) {
            opts.tableau = parse_tableau(tableau, errors_, options_.strict);
        }

        if (sim["timeseries_steps"] && !opts.save_timeseries) {
            push_warning(warnings_, kDiagIgnoredField,
                         "'simulation.timeseries_steps' has no effect with save_timeseries: false");
        }
        if (sim["adaptive_controller"] && !opts.adaptive) {
            push_warning(warnings_, kDiagIgnoredField,
                         "'simulation.adaptive_controller' has no effect with adaptive: false");
        }
    }

    // Output
    if (const YAML::Node output = root["output"]) {
        if (!output.IsMap()) {
            push_type_mismatch_error(errors_, "output", "map", output);
            return;
        }
        validate_keys(output, {"path"}, "output", errors_, options_.strict);
        config.output_path = parse_string_scalar(output["path"], "output.path", errors_);
    }
}

}  // namespace stochsim::v1::parser
