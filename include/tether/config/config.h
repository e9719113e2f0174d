// include/tether/config/config.h
#ifndef TETHER_CONFIG_CONFIG_H
#define TETHER_CONFIG_CONFIG_H

#include "tether/common/logging.h"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace tether {

enum class TokenCounterBackend : uint8_t {
    LOCAL,    // approximate in-process tokenizer
    EXTERNAL, // llama.cpp vocabulary (GGUF)
    AUTO      // EXTERNAL when a vocabulary is available, else LOCAL
};

enum class PricingSourceKind : uint8_t {
    BUNDLED,
    EXTERNAL // bundled table first, then an external price file
};

enum class TraceExportKind : uint8_t {
    CONSOLE,
    JSON,
    NONE
};

TokenCounterBackend parse_token_counter_backend(const std::string& name);
PricingSourceKind parse_pricing_source(const std::string& name);
TraceExportKind parse_trace_export(const std::string& name);

const char* to_string(TokenCounterBackend backend);
const char* to_string(PricingSourceKind source);
const char* to_string(TraceExportKind kind);

struct TetherConfig {
    double default_budget_usd = 10.0;
    int default_max_turns = 50;
    TokenCounterBackend token_counter_backend = TokenCounterBackend::AUTO;
    PricingSourceKind pricing_source = PricingSourceKind::BUNDLED;
    LogLevel log_level = LogLevel::WARNING;
    TraceExportKind trace_export = TraceExportKind::CONSOLE;
    std::string trace_export_path = "./traces/";
    std::string tokenizer_vocab_path; // GGUF file used by the EXTERNAL backend
    std::string pricing_file;         // price table used by PricingSourceKind::EXTERNAL

    // Throws std::invalid_argument
    void validate() const;

    nlohmann::json to_json() const;

    // Defaults <- TETHER_CONFIG_FILE (YAML) <- TETHER_* environment
    static TetherConfig from_env();
};

// Call-site values; anything set here wins over the environment
struct ConfigOverrides {
    std::optional<double> default_budget_usd;
    std::optional<int> default_max_turns;
    std::optional<TokenCounterBackend> token_counter_backend;
    std::optional<PricingSourceKind> pricing_source;
    std::optional<LogLevel> log_level;
    std::optional<TraceExportKind> trace_export;
    std::optional<std::string> trace_export_path;
    std::optional<std::string> tokenizer_vocab_path;
    std::optional<std::string> pricing_file;
};

// Overrides <- environment <- config file <- defaults, validated
TetherConfig load_config(const ConfigOverrides& overrides = {});

// Applies the keys present in a YAML file on top of `base`
TetherConfig load_config_file(const std::string& path, TetherConfig base = {});

// Applies the process log level from the config
void configure_logging(const TetherConfig& config);

} // namespace tether

#endif // TETHER_CONFIG_CONFIG_H
