// include/tether/pricing/pricing_registry.h
#ifndef TETHER_PRICING_PRICING_REGISTRY_H
#define TETHER_PRICING_PRICING_REGISTRY_H

#include "tether/config/config.h"
#include <nlohmann/json.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

// USD per 1000 tokens
struct ModelPrice {
    double input_cost = 0.0;
    double output_cost = 0.0;
};

// Pricing consulted after the bundled table when the registry runs in
// PricingSourceKind::EXTERNAL mode.
class PricingSource {
public:
    virtual ~PricingSource() = default;
    virtual std::optional<ModelPrice> lookup(const std::string& model) const = 0;
};

// Price table in the LiteLLM model_prices_and_context_window.json layout:
//   {"gpt-4o": {"input_cost_per_token": 2.5e-06, "output_cost_per_token": 1e-05}, ...}
class JsonPricingSource : public PricingSource {
public:
    explicit JsonPricingSource(const nlohmann::json& table);

    static std::unique_ptr<JsonPricingSource> from_file(const std::string& path);

    std::optional<ModelPrice> lookup(const std::string& model) const override;
    size_t size() const { return prices_.size(); }

private:
    std::unordered_map<std::string, ModelPrice> prices_;
};

class PricingRegistry {
public:
    explicit PricingRegistry(PricingSourceKind source = PricingSourceKind::BUNDLED,
                             std::shared_ptr<const PricingSource> external = nullptr);

    // Lowercase + trim, then the alias table; unknown names come back unchanged
    std::string resolve_alias(const std::string& model) const;

    // Throw UnknownModelError carrying `model` as given
    double input_cost(const std::string& model) const;
    double output_cost(const std::string& model) const;

    // input_cost * input_tokens / 1000 + output_cost * output_tokens / 1000
    double estimate_call_cost(const std::string& model, int input_tokens, int output_tokens) const;

    // Shadows any bundled entry for the same key
    void register_custom_model(const std::string& model, double input_cost, double output_cost);

    bool has_model(const std::string& model) const;
    std::vector<std::string> list_models() const;

    PricingSourceKind source() const { return source_; }

    static const std::map<std::string, ModelPrice>& bundled_prices();
    static const std::map<std::string, std::string>& aliases();

private:
    std::optional<ModelPrice> find(const std::string& model) const;
    ModelPrice lookup(const std::string& model) const;

    PricingSourceKind source_;
    std::shared_ptr<const PricingSource> external_;

    mutable std::mutex mutex_; // guards custom_
    std::unordered_map<std::string, ModelPrice> custom_;
};

} // namespace tether

#endif // TETHER_PRICING_PRICING_REGISTRY_H
