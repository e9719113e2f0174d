// src/pricing/pricing_registry.cpp
#include "tether/pricing/pricing_registry.h"
#include "tether/common/errors.h"
#include "tether/common/utils.h"
#include <fstream>
#include <set>
#include <stdexcept>

namespace tether {

const std::map<std::string, ModelPrice>& PricingRegistry::bundled_prices() {
    static const std::map<std::string, ModelPrice> prices = {
        {"gpt-4.1", {0.003, 0.012}},
        {"gpt-4.1-mini", {0.0008, 0.0032}},
        {"gpt-4.1-nano", {0.0002, 0.0008}},
        {"gpt-4o", {0.0025, 0.01}},
        {"gpt-4o-mini", {0.00015, 0.0006}},
        {"gpt-4-turbo", {0.01, 0.03}},
        {"gpt-4", {0.03, 0.06}},
        {"gpt-3.5-turbo", {0.0005, 0.002}},
        {"claude-3-5-sonnet-20241022", {0.003, 0.015}},
        {"claude-3-5-sonnet", {0.003, 0.015}},
        {"claude-3-opus-20240229", {0.015, 0.075}},
        {"claude-3-opus", {0.015, 0.075}},
        {"claude-3-sonnet-20240229", {0.003, 0.015}},
        {"claude-3-sonnet", {0.003, 0.015}},
        {"claude-3-haiku-20240307", {0.00025, 0.00125}},
        {"claude-3-haiku", {0.00025, 0.00125}},
        {"gemini-1.5-pro", {0.00125, 0.005}},
        {"gemini-1.5-flash", {0.000075, 0.0003}},
        {"gemini-1.5-flash-8b", {0.0000375, 0.00015}},
        {"llama-3-70b", {0.0008, 0.0008}},
        {"llama-3-8b", {0.0002, 0.0002}},
        {"mixtral-8x7b", {0.00024, 0.00024}},
        {"mistral-small", {0.001, 0.003}},
        {"mistral-medium", {0.0024, 0.0072}},
        {"mistral-large", {0.004, 0.012}},
    };
    return prices;
}

const std::map<std::string, std::string>& PricingRegistry::aliases() {
    static const std::map<std::string, std::string> table = {
        {"gpt4o", "gpt-4o"},
        {"gpt-4o", "gpt-4o"},
        {"gpt4o-mini", "gpt-4o-mini"},
        {"gpt-4-turbo", "gpt-4-turbo"},
        {"gpt4", "gpt-4"},
        {"gpt-4", "gpt-4"},
        {"gpt-3.5-turbo", "gpt-3.5-turbo"},
        {"claude-sonnet", "claude-3-5-sonnet-20241022"},
        {"claude-3.5-sonnet", "claude-3-5-sonnet-20241022"},
        {"claude-opus", "claude-3-opus-20240229"},
        {"claude-3-opus", "claude-3-opus-20240229"},
        {"claude-sonnet-20240229", "claude-3-sonnet-20240229"},
        {"claude-3-sonnet-20240229", "claude-3-sonnet-20240229"},
        {"claude-haiku", "claude-3-haiku-20240307"},
        {"claude-3-haiku", "claude-3-haiku-20240307"},
    };
    return table;
}

JsonPricingSource::JsonPricingSource(const nlohmann::json& table) {
    if (!table.is_object()) {
        throw std::invalid_argument("Pricing table must be a JSON object");
    }
    for (auto it = table.begin(); it != table.end(); ++it) {
        const auto& entry = it.value();
        if (!entry.is_object()) continue;
        // LiteLLM ships a "sample_spec" entry and non-chat models without token prices
        if (!entry.contains("input_cost_per_token") || !entry["input_cost_per_token"].is_number()) continue;
        if (!entry.contains("output_cost_per_token") || !entry["output_cost_per_token"].is_number()) continue;

        ModelPrice price;
        price.input_cost = entry["input_cost_per_token"].get<double>() * 1000.0;
        price.output_cost = entry["output_cost_per_token"].get<double>() * 1000.0;
        prices_[it.key()] = price;
    }
}

std::unique_ptr<JsonPricingSource> JsonPricingSource::from_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open pricing file: " + path);
    }
    nlohmann::json table;
    try {
        file >> table;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Invalid pricing file '" + path + "': " + e.what());
    }
    return std::make_unique<JsonPricingSource>(table);
}

std::optional<ModelPrice> JsonPricingSource::lookup(const std::string& model) const {
    auto it = prices_.find(model);
    if (it == prices_.end()) {
        return std::nullopt;
    }
    return it->second;
}

PricingRegistry::PricingRegistry(PricingSourceKind source, std::shared_ptr<const PricingSource> external)
    : source_(source), external_(std::move(external)) {}

std::string PricingRegistry::resolve_alias(const std::string& model) const {
    const auto& table = aliases();
    auto it = table.find(normalize_name(model));
    return it != table.end() ? it->second : model;
}

std::optional<ModelPrice> PricingRegistry::find(const std::string& model) const {
    std::string resolved = resolve_alias(model);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = custom_.find(resolved);
        if (it != custom_.end()) {
            return it->second;
        }
    }

    const auto& bundled = bundled_prices();
    auto it = bundled.find(resolved);
    if (it != bundled.end()) {
        return it->second;
    }

    if (source_ == PricingSourceKind::EXTERNAL && external_) {
        if (auto price = external_->lookup(resolved)) {
            return price;
        }
        if (resolved != model) {
            return external_->lookup(model);
        }
    }
    return std::nullopt;
}

ModelPrice PricingRegistry::lookup(const std::string& model) const {
    if (auto price = find(model)) {
        return *price;
    }
    if (source_ == PricingSourceKind::EXTERNAL && !external_) {
        throw UnknownModelError("Unknown model: " + model + " (no external pricing source)", model);
    }
    throw UnknownModelError("Unknown model: " + model, model);
}

double PricingRegistry::input_cost(const std::string& model) const {
    return lookup(model).input_cost;
}

double PricingRegistry::output_cost(const std::string& model) const {
    return lookup(model).output_cost;
}

double PricingRegistry::estimate_call_cost(const std::string& model, int input_tokens, int output_tokens) const {
    ModelPrice price = lookup(model);
    return price.input_cost * input_tokens / 1000.0 + price.output_cost * output_tokens / 1000.0;
}

void PricingRegistry::register_custom_model(const std::string& model, double input_cost, double output_cost) {
    if (input_cost < 0 || output_cost < 0) {
        throw std::invalid_argument("Model costs must be non-negative");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    custom_[model] = ModelPrice{input_cost, output_cost};
}

bool PricingRegistry::has_model(const std::string& model) const {
    return find(model).has_value();
}

std::vector<std::string> PricingRegistry::list_models() const {
    std::set<std::string> names;
    for (const auto& [name, _] : bundled_prices()) {
        names.insert(name);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [name, _] : custom_) {
            names.insert(name);
        }
    }
    return {names.begin(), names.end()};
}

} // namespace tether
