// tests/test_config.cpp
#include <catch2/catch_test_macros.hpp>
#include "tether/common/utils.h"
#include "tether/config/config.h"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>
#include <vector>

using namespace tether;

namespace {

const char* const kTetherEnv[] = {
    "TETHER_DEFAULT_BUDGET_USD", "TETHER_DEFAULT_MAX_TURNS", "TETHER_TOKEN_COUNTER_BACKEND",
    "TETHER_PRICING_SOURCE",     "TETHER_LOG_LEVEL",         "TETHER_TRACE_EXPORT",
    "TETHER_TRACE_EXPORT_PATH",  "TETHER_TOKENIZER_VOCAB",   "TETHER_PRICING_FILE",
    "TETHER_CONFIG_FILE",
};

// Clears every TETHER_* variable for the duration of a test
class CleanEnvironment {
public:
    CleanEnvironment() {
        for (const char* name : kTetherEnv) {
            if (const char* value = std::getenv(name)) {
                saved_.emplace_back(name, value);
            }
            unsetenv(name);
        }
    }
    ~CleanEnvironment() {
        for (const char* name : kTetherEnv) {
            unsetenv(name);
        }
        for (const auto& [name, value] : saved_) {
            setenv(name.c_str(), value.c_str(), 1);
        }
    }

    void set(const char* name, const std::string& value) { setenv(name, value.c_str(), 1); }

private:
    std::vector<std::pair<std::string, std::string>> saved_;
};

std::filesystem::path write_yaml(const std::string& body) {
    auto path = std::filesystem::temp_directory_path() / ("tether_config_" + generate_hex_id(8) + ".yaml");
    std::ofstream out(path);
    out << body;
    return path;
}

} // namespace

TEST_CASE("Defaults apply when nothing is configured", "[config]") {
    CleanEnvironment env;
    TetherConfig config = load_config();

    REQUIRE(config.default_budget_usd == 10.0);
    REQUIRE(config.default_max_turns == 50);
    REQUIRE(config.token_counter_backend == TokenCounterBackend::AUTO);
    REQUIRE(config.pricing_source == PricingSourceKind::BUNDLED);
    REQUIRE(config.log_level == LogLevel::WARNING);
    REQUIRE(config.trace_export == TraceExportKind::CONSOLE);
    REQUIRE(config.trace_export_path == "./traces/");
    REQUIRE(config.tokenizer_vocab_path.empty());
}

TEST_CASE("Environment overrides defaults", "[config]") {
    CleanEnvironment env;
    env.set("TETHER_DEFAULT_BUDGET_USD", "2.5");
    env.set("TETHER_DEFAULT_MAX_TURNS", "12");
    env.set("TETHER_TOKEN_COUNTER_BACKEND", "LOCAL");
    env.set("TETHER_PRICING_SOURCE", "external");
    env.set("TETHER_LOG_LEVEL", "debug");
    env.set("TETHER_TRACE_EXPORT", "json");
    env.set("TETHER_TRACE_EXPORT_PATH", "/var/tmp/traces");
    env.set("TETHER_PRICING_FILE", "/etc/prices.json");

    TetherConfig config = load_config();
    REQUIRE(config.default_budget_usd == 2.5);
    REQUIRE(config.default_max_turns == 12);
    REQUIRE(config.token_counter_backend == TokenCounterBackend::LOCAL);
    REQUIRE(config.pricing_source == PricingSourceKind::EXTERNAL);
    REQUIRE(config.log_level == LogLevel::DEBUG);
    REQUIRE(config.trace_export == TraceExportKind::JSON);
    REQUIRE(config.trace_export_path == "/var/tmp/traces");
    REQUIRE(config.pricing_file == "/etc/prices.json");
}

TEST_CASE("Empty environment values count as unset", "[config]") {
    CleanEnvironment env;
    env.set("TETHER_DEFAULT_BUDGET_USD", "");
    REQUIRE(load_config().default_budget_usd == 10.0);
}

TEST_CASE("Call-site overrides beat the environment", "[config]") {
    CleanEnvironment env;
    env.set("TETHER_DEFAULT_BUDGET_USD", "2.5");
    env.set("TETHER_TRACE_EXPORT", "json");

    ConfigOverrides overrides;
    overrides.default_budget_usd = 0.75;
    overrides.trace_export = TraceExportKind::NONE;

    TetherConfig config = load_config(overrides);
    REQUIRE(config.default_budget_usd == 0.75);
    REQUIRE(config.trace_export == TraceExportKind::NONE);
}

TEST_CASE("Malformed values are rejected", "[config]") {
    CleanEnvironment env;

    SECTION("budget that is not a number") {
        env.set("TETHER_DEFAULT_BUDGET_USD", "ten dollars");
        REQUIRE_THROWS_AS(load_config(), std::invalid_argument);
    }
    SECTION("turn count with trailing junk") {
        env.set("TETHER_DEFAULT_MAX_TURNS", "12abc");
        REQUIRE_THROWS_AS(load_config(), std::invalid_argument);
    }
    SECTION("unknown backend") {
        env.set("TETHER_TOKEN_COUNTER_BACKEND", "tiktoken");
        REQUIRE_THROWS_AS(load_config(), std::invalid_argument);
    }
    SECTION("negative budget") {
        env.set("TETHER_DEFAULT_BUDGET_USD", "-1");
        REQUIRE_THROWS_AS(load_config(), std::invalid_argument);
    }
    SECTION("unknown log level") {
        env.set("TETHER_LOG_LEVEL", "verbose");
        REQUIRE_THROWS_AS(load_config(), std::invalid_argument);
    }
}

TEST_CASE("Validation rules", "[config]") {
    TetherConfig config;
    REQUIRE_NOTHROW(config.validate());

    config.default_max_turns = -1;
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);

    config.default_max_turns = 0;
    config.trace_export = TraceExportKind::JSON;
    config.trace_export_path.clear();
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
}

TEST_CASE("YAML config file sits between defaults and environment", "[config][yaml]") {
    CleanEnvironment env;
    auto path = write_yaml(
        "default_budget_usd: 4.0\n"
        "default_max_turns: 20\n"
        "token_counter_backend: local\n"
        "trace_export: none\n"
        "trace_export_path: \"./run-traces/\"\n");
    env.set("TETHER_CONFIG_FILE", path.string());
    env.set("TETHER_DEFAULT_MAX_TURNS", "30");

    TetherConfig config = load_config();
    REQUIRE(config.default_budget_usd == 4.0);
    REQUIRE(config.default_max_turns == 30);
    REQUIRE(config.token_counter_backend == TokenCounterBackend::LOCAL);
    REQUIRE(config.trace_export == TraceExportKind::NONE);
    REQUIRE(config.trace_export_path == "./run-traces/");

    std::filesystem::remove(path);
}

TEST_CASE("load_config_file keeps keys the file does not mention", "[config][yaml]") {
    auto path = write_yaml("log_level: error\n");

    TetherConfig base;
    base.default_budget_usd = 1.25;
    TetherConfig config = load_config_file(path.string(), base);
    REQUIRE(config.log_level == LogLevel::ERROR);
    REQUIRE(config.default_budget_usd == 1.25);

    std::filesystem::remove(path);
    REQUIRE_THROWS_AS(load_config_file(path.string()), std::runtime_error);
}

TEST_CASE("Non-mapping config file is rejected", "[config][yaml]") {
    auto path = write_yaml("- local\n- external\n");
    REQUIRE_THROWS_AS(load_config_file(path.string()), std::runtime_error);
    std::filesystem::remove(path);
}

TEST_CASE("Config file values must have the field's type", "[config][yaml]") {
    auto bad_budget = write_yaml("default_budget_usd: lots\n");
    REQUIRE_THROWS_AS(load_config_file(bad_budget.string()), std::invalid_argument);
    std::filesystem::remove(bad_budget);

    auto fractional_turns = write_yaml("default_max_turns: 12.5\n");
    REQUIRE_THROWS_AS(load_config_file(fractional_turns.string()), std::invalid_argument);
    std::filesystem::remove(fractional_turns);

    auto nested = write_yaml("trace_export_path:\n  dir: ./traces\n");
    REQUIRE_THROWS_AS(load_config_file(nested.string()), std::invalid_argument);
    std::filesystem::remove(nested);

    auto quoted = write_yaml("default_budget_usd: \"2.5\"\ndefault_max_turns: 7\n");
    TetherConfig config = load_config_file(quoted.string());
    REQUIRE(config.default_budget_usd == 2.5);
    REQUIRE(config.default_max_turns == 7);
    std::filesystem::remove(quoted);
}

TEST_CASE("An empty config file changes nothing", "[config][yaml]") {
    auto path = write_yaml("");
    TetherConfig base;
    base.default_max_turns = 9;
    REQUIRE(load_config_file(path.string(), base).default_max_turns == 9);
    std::filesystem::remove(path);
}

TEST_CASE("Enum names parse and print", "[config]") {
    REQUIRE(parse_trace_export("noop") == TraceExportKind::NONE);
    REQUIRE(parse_trace_export(" Console ") == TraceExportKind::CONSOLE);
    REQUIRE(parse_pricing_source("BUNDLED") == PricingSourceKind::BUNDLED);
    REQUIRE_THROWS_AS(parse_pricing_source("litellm"), std::invalid_argument);
    REQUIRE(parse_log_level("WARN") == LogLevel::WARNING);

    REQUIRE(std::string(to_string(TokenCounterBackend::EXTERNAL)) == "external");
    REQUIRE(std::string(to_string(TraceExportKind::NONE)) == "none");

    TetherConfig config;
    auto j = config.to_json();
    REQUIRE(j["token_counter_backend"] == "auto");
    REQUIRE(j["log_level"] == "WARNING");
    REQUIRE(j["default_max_turns"] == 50);
}

TEST_CASE("configure_logging applies the level", "[config]") {
    LogLevel before = log_level();
    TetherConfig config;
    config.log_level = LogLevel::ERROR;
    configure_logging(config);
    REQUIRE(log_level() == LogLevel::ERROR);
    set_log_level(before);
}
