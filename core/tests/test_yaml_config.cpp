#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "stochsim/v1/integrator.hpp"
#include "stochsim/v1/parser/yaml_config.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <string>

using namespace stochsim::v1;
using namespace stochsim::v1::parser;
using Catch::Approx;

namespace {

bool has_diagnostic(const std::vector<std::string>& messages, const std::string& code) {
    return std::any_of(messages.begin(), messages.end(), [&](const std::string& m) {
        return m.find(code) != std::string::npos;
    });
}

}  // namespace

TEST_CASE("YAML run file fills problem and options", "[v1][yaml]") {
    const std::string yaml = R"(schema: stochsim-v1
version: 1
problem:
  name: linear
  parameters:
    alpha: 1.5
    beta: 0.25
  u0: 2.0
simulation:
  tstart: 0
  tstop: 2
  dt: 10m
  algorithm: RKMil
  adaptive: true
  abstol: 1e-4
  reltol: 1u
  qmax: 1.2
  maxiters: 1e6
  internalnorm: inf
  adaptive_controller: PI
  seed: 17
  timeseries_steps: 5
output:
  path: linear.csv
)";

    YamlConfigParser parser;
    const RunConfig config = parser.load_string(yaml);
    INFO((parser.errors().empty() ? std::string() : parser.errors().front()));
    REQUIRE(parser.errors().empty());

    CHECK(config.problem_name == "linear");
    CHECK(config.parameters.at("alpha") == Approx(1.5));
    REQUIRE(config.u0.has_value());
    CHECK((*config.u0)[0] == Approx(2.0));
    CHECK(config.time_span[1] == Approx(2.0));

    const SolveOptions& opts = config.options;
    CHECK(opts.dt == Approx(0.01));
    CHECK(opts.algorithm == Algorithm::RKMil);
    CHECK(opts.adaptive);
    CHECK(opts.abstol == Approx(1e-4));
    CHECK(opts.reltol == Approx(1e-6));
    CHECK(opts.qmax == Approx(1.2));
    CHECK(opts.maxiters == 1000000);
    CHECK(std::isinf(opts.internalnorm));
    CHECK(opts.adaptive_controller == AdaptiveController::PI);
    CHECK(opts.seed == 17);
    CHECK(opts.timeseries_steps == 5);
    REQUIRE(config.output_path.has_value());
    CHECK(*config.output_path == "linear.csv");

    auto problem = config.build_problem();
    REQUIRE(problem.has_value());
    const Solution sol = solve(*problem, config.time_span, opts);
    CHECK(sol.success());
}

TEST_CASE("YAML strict mode rejects unknown fields", "[v1][yaml]") {
    const std::string yaml = R"(schema: stochsim-v1
version: 1
problem:
  name: cubic
simulation:
  tstop: 1
  stepsize: 0.1
)";

    YamlConfigParser strict;
    (void)strict.load_string(yaml);
    CHECK(has_diagnostic(strict.errors(), "STOCHSIM_YAML_E_UNKNOWN_FIELD"));

    YamlConfigParser lenient(YamlConfigOptions{.strict = false});
    (void)lenient.load_string(yaml);
    CHECK(lenient.errors().empty());
}

TEST_CASE("YAML reports coded diagnostics", "[v1][yaml]") {
    YamlConfigParser parser;

    SECTION("unknown algorithm") {
        (void)parser.load_string(R"(schema: stochsim-v1
version: 1
problem: {name: linear}
simulation: {algorithm: RK4}
)");
        CHECK(has_diagnostic(parser.errors(), "STOCHSIM_YAML_E_ALGORITHM_INVALID"));
    }

    SECTION("unknown problem") {
        (void)parser.load_string(R"(schema: stochsim-v1
version: 1
problem: {name: lorenz}
)");
        CHECK(has_diagnostic(parser.errors(), "STOCHSIM_YAML_E_PROBLEM_UNSUPPORTED"));
    }

    SECTION("parameter the problem does not have") {
        (void)parser.load_string(R"(schema: stochsim-v1
version: 1
problem:
  name: linear
  parameters: {gamma: 1.0}
)");
        CHECK(has_diagnostic(parser.errors(), "STOCHSIM_YAML_E_PARAM_INVALID"));
    }

    SECTION("type mismatch") {
        (void)parser.load_string(R"(schema: stochsim-v1
version: 1
problem: {name: linear}
simulation:
  dt: [1, 2]
  adaptive: maybe
)");
        CHECK(has_diagnostic(parser.errors(), "STOCHSIM_YAML_E_TYPE_MISMATCH"));
        CHECK(parser.errors().size() == 2);
    }

    SECTION("ignored field warning") {
        const RunConfig config = parser.load_string(R"(schema: stochsim-v1
version: 1
problem: {name: linear}
simulation:
  save_timeseries: false
  timeseries_steps: 10
)");
        CHECK(parser.errors().empty());
        CHECK(has_diagnostic(parser.warnings(), "STOCHSIM_YAML_W_FIELD_IGNORED"));
        CHECK_FALSE(config.options.save_timeseries);
    }
}

TEST_CASE("YAML schema and version are required", "[v1][yaml]") {
    YamlConfigParser parser;

    (void)parser.load_string("version: 1\nproblem: {name: linear}\n");
    REQUIRE_FALSE(parser.errors().empty());
    CHECK(parser.errors().front().find("schema") != std::string::npos);

    (void)parser.load_string("schema: stochsim-v1\nversion: 2\nproblem: {name: linear}\n");
    REQUIRE_FALSE(parser.errors().empty());
    CHECK(parser.errors().front().find("version") != std::string::npos);

    (void)parser.load_string("schema: [unterminated\n");
    CHECK_FALSE(parser.errors().empty());
}

TEST_CASE("YAML tableau by name and by coefficients", "[v1][yaml][tableau]") {
    YamlConfigParser parser;

    SECTION("named") {
        const RunConfig config = parser.load_string(R"(schema: stochsim-v1
version: 1
problem: {name: additive}
simulation:
  algorithm: SRA
  tableau: SRA1
)");
        REQUIRE(parser.errors().empty());
        REQUIRE(config.options.tableau.has_value());
        CHECK(tableau_name(*config.options.tableau) == "SRA1");
    }

    SECTION("custom SRA coefficients") {
        const RunConfig config = parser.load_string(R"(schema: stochsim-v1
version: 1
problem: {name: additive}
simulation:
  algorithm: SRA
  dt: 0.01
  tableau:
    family: sra
    name: midpoint-sra
    order: 1.0
    c0: [0, 0.5]
    c1: [1, 0]
    A0: [[0, 0], [0.5, 0]]
    B0: [[0, 0], [1, 0]]
    alpha: [0, 1]
    beta1: [1, 0]
    beta2: [-1, 1]
)");
        INFO((parser.errors().empty() ? std::string() : parser.errors().front()));
        REQUIRE(parser.errors().empty());
        REQUIRE(config.options.tableau.has_value());
        const auto* sra = std::get_if<SRATableau>(&*config.options.tableau);
        REQUIRE(sra != nullptr);
        CHECK(sra->name == "midpoint-sra");
        CHECK(sra->A0(1, 0) == Approx(0.5));
        CHECK(check_order_conditions(*sra).empty());

        auto problem = config.build_problem();
        REQUIRE(problem.has_value());
        CHECK(solve(*problem, config.time_span, config.options).success());
    }

    SECTION("missing coefficients") {
        (void)parser.load_string(R"(schema: stochsim-v1
version: 1
problem: {name: linear}
simulation:
  algorithm: SRI
  tableau: {family: sri, c0: [0, 1]}
)");
        CHECK(has_diagnostic(parser.errors(), "STOCHSIM_YAML_E_TABLEAU_INVALID"));
    }
}

TEST_CASE("YAML run file for a jump process", "[v1][yaml][jumps]") {
    YamlConfigParser parser;
    const RunConfig config = parser.load_string(R"(schema: stochsim-v1
version: 1
problem:
  name: birth_death
  parameters: {birth_rate: 5, death_rate: 0.5}
  u0: [4]
simulation:
  tstop: 10
  dt: 0.05
  algorithm: TauLeaping
  save_timeseries: false
)");
    REQUIRE(parser.errors().empty());

    auto problem = config.build_problem();
    REQUIRE(problem.has_value());
    CHECK(problem->has_jumps());
    const Solution sol = solve(*problem, config.time_span, config.options);
    CHECK(sol.success());
    CHECK(sol.accepted_steps == 200);
}

TEST_CASE("Shipped run files load and integrate", "[v1][yaml][configs]") {
    const std::filesystem::path dir = STOCHSIM_CONFIG_DIR;
    for (const char* name : {"linear_sriw1.yaml", "additive_sra.yaml", "birth_death_tau.yaml"}) {
        INFO(name);
        YamlConfigParser parser;
        const RunConfig config = parser.load(dir / name);
        REQUIRE(parser.errors().empty());

        auto problem = config.build_problem();
        REQUIRE(problem.has_value());
        const Solution sol = solve(*problem, config.time_span, config.options);
        CHECK(sol.success());
        CHECK(sol.t == config.time_span[1]);
    }
}

TEST_CASE("Missing run file is reported", "[v1][yaml]") {
    YamlConfigParser parser;
    (void)parser.load("does/not/exist.yaml");
    REQUIRE(parser.errors().size() == 1);
    CHECK(parser.errors().front().find("Cannot open") != std::string::npos);
}
