// src/config/config.cpp
#include "tether/config/config.h"
#include "tether/common/utils.h"
#include <yaml-cpp/yaml.h>
#include <stdexcept>

namespace tether {

namespace {

constexpr const char* kEnvConfigFile = "TETHER_CONFIG_FILE";

double parse_double(const std::string& key, const std::string& text) {
    size_t pos = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid number for " + key + ": '" + text + "'");
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Invalid number for " + key + ": '" + text + "'");
    }
    return value;
}

int parse_int(const std::string& key, const std::string& text) {
    size_t pos = 0;
    int value = 0;
    try {
        value = std::stoi(text, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid integer for " + key + ": '" + text + "'");
    }
    if (pos != text.size()) {
        throw std::invalid_argument("Invalid integer for " + key + ": '" + text + "'");
    }
    return value;
}

void apply_environment(TetherConfig& config) {
    if (auto v = get_env("TETHER_DEFAULT_BUDGET_USD")) {
        config.default_budget_usd = parse_double("TETHER_DEFAULT_BUDGET_USD", *v);
    }
    if (auto v = get_env("TETHER_DEFAULT_MAX_TURNS")) {
        config.default_max_turns = parse_int("TETHER_DEFAULT_MAX_TURNS", *v);
    }
    if (auto v = get_env("TETHER_TOKEN_COUNTER_BACKEND")) {
        config.token_counter_backend = parse_token_counter_backend(*v);
    }
    if (auto v = get_env("TETHER_PRICING_SOURCE")) {
        config.pricing_source = parse_pricing_source(*v);
    }
    if (auto v = get_env("TETHER_LOG_LEVEL")) {
        config.log_level = parse_log_level(*v);
    }
    if (auto v = get_env("TETHER_TRACE_EXPORT")) {
        config.trace_export = parse_trace_export(*v);
    }
    if (auto v = get_env("TETHER_TRACE_EXPORT_PATH")) {
        config.trace_export_path = *v;
    }
    if (auto v = get_env("TETHER_TOKENIZER_VOCAB")) {
        config.tokenizer_vocab_path = *v;
    }
    if (auto v = get_env("TETHER_PRICING_FILE")) {
        config.pricing_file = *v;
    }
}

template <typename T>
T read_scalar(const YAML::Node& root, const char* key, const std::string& path) {
    const YAML::Node node = root[key];
    if (!node.IsScalar()) {
        throw std::invalid_argument(std::string("Config key ") + key + " in '" + path + "' must be a scalar");
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        throw std::invalid_argument(std::string("Invalid value for ") + key + " in '" + path + "': '" +
                                    node.Scalar() + "'");
    }
}

} // namespace

TokenCounterBackend parse_token_counter_backend(const std::string& name) {
    std::string normalized = normalize_name(name);
    if (normalized == "local") return TokenCounterBackend::LOCAL;
    if (normalized == "external") return TokenCounterBackend::EXTERNAL;
    if (normalized == "auto") return TokenCounterBackend::AUTO;
    throw std::invalid_argument("Invalid token_counter_backend: " + name +
                                ". Must be one of (local, external, auto)");
}

PricingSourceKind parse_pricing_source(const std::string& name) {
    std::string normalized = normalize_name(name);
    if (normalized == "bundled") return PricingSourceKind::BUNDLED;
    if (normalized == "external") return PricingSourceKind::EXTERNAL;
    throw std::invalid_argument("Invalid pricing_source: " + name + ". Must be one of (bundled, external)");
}

TraceExportKind parse_trace_export(const std::string& name) {
    std::string normalized = normalize_name(name);
    if (normalized == "console") return TraceExportKind::CONSOLE;
    if (normalized == "json") return TraceExportKind::JSON;
    if (normalized == "none" || normalized == "noop") return TraceExportKind::NONE;
    throw std::invalid_argument("Invalid trace_export: " + name + ". Must be one of (console, json, none)");
}

const char* to_string(TokenCounterBackend backend) {
    switch (backend) {
        case TokenCounterBackend::LOCAL: return "local";
        case TokenCounterBackend::EXTERNAL: return "external";
        case TokenCounterBackend::AUTO: return "auto";
    }
    return "auto";
}

const char* to_string(PricingSourceKind source) {
    return source == PricingSourceKind::EXTERNAL ? "external" : "bundled";
}

const char* to_string(TraceExportKind kind) {
    switch (kind) {
        case TraceExportKind::CONSOLE: return "console";
        case TraceExportKind::JSON: return "json";
        case TraceExportKind::NONE: return "none";
    }
    return "console";
}

void TetherConfig::validate() const {
    if (default_budget_usd < 0) {
        throw std::invalid_argument("default_budget_usd must be non-negative");
    }
    if (default_max_turns < 0) {
        throw std::invalid_argument("default_max_turns must be non-negative");
    }
    if (trace_export == TraceExportKind::JSON && trace_export_path.empty()) {
        throw std::invalid_argument("trace_export_path must be set when trace_export is json");
    }
}

nlohmann::json TetherConfig::to_json() const {
    nlohmann::json obj;
    obj["default_budget_usd"] = default_budget_usd;
    obj["default_max_turns"] = default_max_turns;
    obj["token_counter_backend"] = to_string(token_counter_backend);
    obj["pricing_source"] = to_string(pricing_source);
    obj["log_level"] = log_level_name(log_level);
    obj["trace_export"] = to_string(trace_export);
    obj["trace_export_path"] = trace_export_path;
    obj["tokenizer_vocab_path"] = tokenizer_vocab_path;
    obj["pricing_file"] = pricing_file;
    return obj;
}

TetherConfig TetherConfig::from_env() {
    TetherConfig config;
    if (auto file = get_env(kEnvConfigFile)) {
        config = load_config_file(*file, config);
    }
    apply_environment(config);
    return config;
}

TetherConfig load_config_file(const std::string& path, TetherConfig base) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config file '" + path + "': " + e.what());
    }

    if (root.IsNull()) {
        return base;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config file '" + path + "' must contain a mapping");
    }

    if (root["default_budget_usd"]) {
        base.default_budget_usd = read_scalar<double>(root, "default_budget_usd", path);
    }
    if (root["default_max_turns"]) {
        base.default_max_turns = read_scalar<int>(root, "default_max_turns", path);
    }
    if (root["token_counter_backend"]) {
        base.token_counter_backend =
            parse_token_counter_backend(read_scalar<std::string>(root, "token_counter_backend", path));
    }
    if (root["pricing_source"]) {
        base.pricing_source = parse_pricing_source(read_scalar<std::string>(root, "pricing_source", path));
    }
    if (root["log_level"]) {
        base.log_level = parse_log_level(read_scalar<std::string>(root, "log_level", path));
    }
    if (root["trace_export"]) {
        base.trace_export = parse_trace_export(read_scalar<std::string>(root, "trace_export", path));
    }
    if (root["trace_export_path"]) {
        base.trace_export_path = read_scalar<std::string>(root, "trace_export_path", path);
    }
    if (root["tokenizer_vocab_path"]) {
        base.tokenizer_vocab_path = read_scalar<std::string>(root, "tokenizer_vocab_path", path);
    }
    if (root["pricing_file"]) {
        base.pricing_file = read_scalar<std::string>(root, "pricing_file", path);
    }
    return base;
}

TetherConfig load_config(const ConfigOverrides& overrides) {
    TetherConfig config = TetherConfig::from_env();

    if (overrides.default_budget_usd) config.default_budget_usd = *overrides.default_budget_usd;
    if (overrides.default_max_turns) config.default_max_turns = *overrides.default_max_turns;
    if (overrides.token_counter_backend) config.token_counter_backend = *overrides.token_counter_backend;
    if (overrides.pricing_source) config.pricing_source = *overrides.pricing_source;
    if (overrides.log_level) config.log_level = *overrides.log_level;
    if (overrides.trace_export) config.trace_export = *overrides.trace_export;
    if (overrides.trace_export_path) config.trace_export_path = *overrides.trace_export_path;
    if (overrides.tokenizer_vocab_path) config.tokenizer_vocab_path = *overrides.tokenizer_vocab_path;
    if (overrides.pricing_file) config.pricing_file = *overrides.pricing_file;

    config.validate();
    return config;
}

void configure_logging(const TetherConfig& config) {
    set_log_level(config.log_level);
}

} // namespace tether
