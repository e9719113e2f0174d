// tests/test_pricing.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "tether/common/errors.h"
#include "tether/common/utils.h"
#include "tether/pricing/pricing_registry.h"
#include <filesystem>
#include <fstream>

using namespace tether;
using Catch::Matchers::WithinAbs;

TEST_CASE("Bundled gpt-4o prices", "[pricing]") {
    PricingRegistry pricing;
    REQUIRE(pricing.input_cost("gpt-4o") == 0.0025);
    REQUIRE(pricing.output_cost("gpt-4o") == 0.01);
}

TEST_CASE("Call cost is linear per 1000 tokens", "[pricing]") {
    PricingRegistry pricing;
    double expected = (0.0025 * 1000 + 0.01 * 500) / 1000;
    REQUIRE_THAT(pricing.estimate_call_cost("gpt-4o", 1000, 500), WithinAbs(expected, 1e-4));
    REQUIRE_THAT(pricing.estimate_call_cost("gpt-4o", 1000, 500), WithinAbs(0.0075, 1e-12));
    REQUIRE(pricing.estimate_call_cost("gpt-4o", 0, 0) == 0.0);

    // output cost applies to output tokens only
    REQUIRE_THAT(pricing.estimate_call_cost("gpt-4", 0, 1000), WithinAbs(0.06, 1e-12));
    REQUIRE_THAT(pricing.estimate_call_cost("gpt-4", 1000, 0), WithinAbs(0.03, 1e-12));
}

TEST_CASE("Aliases resolve case-insensitively after trimming", "[pricing]") {
    PricingRegistry pricing;
    REQUIRE(pricing.resolve_alias("gpt4o") == "gpt-4o");
    REQUIRE(pricing.resolve_alias("  GPT4O ") == "gpt-4o");
    REQUIRE(pricing.resolve_alias("Claude-Sonnet") == "claude-3-5-sonnet-20241022");
    REQUIRE(pricing.resolve_alias("claude-haiku") == "claude-3-haiku-20240307");
    REQUIRE(pricing.resolve_alias("My-Model") == "My-Model");

    REQUIRE(pricing.input_cost("claude-opus") == 0.015);
    REQUIRE(pricing.output_cost(" GPT4 ") == 0.06);
}

TEST_CASE("Unknown model reports the name as given", "[pricing]") {
    PricingRegistry pricing;
    try {
        pricing.input_cost("Mystery-Model-9000");
        FAIL("lookup should fail");
    } catch (const UnknownModelError& e) {
        REQUIRE(e.model() == "Mystery-Model-9000");
        REQUIRE(e.kind() == ErrorKind::UNKNOWN_MODEL);
    }
    REQUIRE_THROWS_AS(pricing.output_cost("nope"), UnknownModelError);
    REQUIRE_THROWS_AS(pricing.estimate_call_cost("nope", 1, 1), UnknownModelError);
}

TEST_CASE("Custom models shadow bundled entries", "[pricing]") {
    PricingRegistry pricing;
    pricing.register_custom_model("my-finetune", 0.5, 1.5);
    REQUIRE(pricing.input_cost("my-finetune") == 0.5);
    REQUIRE(pricing.output_cost("my-finetune") == 1.5);
    REQUIRE(pricing.has_model("my-finetune"));

    pricing.register_custom_model("gpt-4o", 1.0, 2.0);
    REQUIRE(pricing.input_cost("gpt-4o") == 1.0);
    REQUIRE(pricing.output_cost("gpt4o") == 2.0);

    pricing.register_custom_model("my-finetune", 0.25, 0.75);
    REQUIRE(pricing.input_cost("my-finetune") == 0.25);

    REQUIRE_THROWS_AS(pricing.register_custom_model("bad", -1.0, 1.0), std::invalid_argument);
}

TEST_CASE("Bundled input cost never exceeds output cost", "[pricing]") {
    for (const auto& [model, price] : PricingRegistry::bundled_prices()) {
        INFO(model);
        REQUIRE(price.input_cost > 0.0);
        REQUIRE(price.input_cost <= price.output_cost);
    }
}

TEST_CASE("Every alias target is priced", "[pricing]") {
    PricingRegistry pricing;
    for (const auto& [alias, target] : PricingRegistry::aliases()) {
        INFO(alias);
        REQUIRE(PricingRegistry::bundled_prices().count(target) == 1);
        REQUIRE(pricing.has_model(alias));
    }
}

TEST_CASE("list_models includes bundled and custom names", "[pricing]") {
    PricingRegistry pricing;
    pricing.register_custom_model("zz-custom", 0.1, 0.2);
    auto models = pricing.list_models();
    REQUIRE(models.size() == PricingRegistry::bundled_prices().size() + 1);
    REQUIRE(models.back() == "zz-custom");
}

TEST_CASE("External pricing is consulted only in external mode", "[pricing]") {
    nlohmann::json table = {
        {"sample_spec", {{"max_tokens", 0}}},
        {"acme-large", {{"input_cost_per_token", 0.000002}, {"output_cost_per_token", 0.000008}}},
        {"embedding-only", {{"input_cost_per_token", 0.0000001}}},
    };
    auto source = std::make_shared<JsonPricingSource>(table);
    REQUIRE(source->size() == 1);

    PricingRegistry external(PricingSourceKind::EXTERNAL, source);
    REQUIRE_THAT(external.input_cost("acme-large"), WithinAbs(0.002, 1e-12));
    REQUIRE_THAT(external.output_cost("acme-large"), WithinAbs(0.008, 1e-12));
    // bundled table still wins for known models
    REQUIRE(external.input_cost("gpt-4o") == 0.0025);
    REQUIRE_THROWS_AS(external.input_cost("embedding-only"), UnknownModelError);

    PricingRegistry bundled(PricingSourceKind::BUNDLED, source);
    REQUIRE_THROWS_AS(bundled.input_cost("acme-large"), UnknownModelError);

    PricingRegistry detached(PricingSourceKind::EXTERNAL);
    REQUIRE_THROWS_AS(detached.input_cost("acme-large"), UnknownModelError);
}

TEST_CASE("JsonPricingSource loads a price file", "[pricing]") {
    auto path = std::filesystem::temp_directory_path() / ("tether_prices_" + generate_hex_id(8) + ".json");
    {
        std::ofstream out(path);
        out << R"({"acme-small": {"input_cost_per_token": 1e-07, "output_cost_per_token": 4e-07}})";
    }

    auto source = JsonPricingSource::from_file(path.string());
    auto price = source->lookup("acme-small");
    REQUIRE(price.has_value());
    REQUIRE_THAT(price->input_cost, WithinAbs(0.0001, 1e-12));
    REQUIRE_THAT(price->output_cost, WithinAbs(0.0004, 1e-12));
    REQUIRE_FALSE(source->lookup("acme-tiny").has_value());

    std::filesystem::remove(path);
    REQUIRE_THROWS_AS(JsonPricingSource::from_file(path.string()), std::runtime_error);
}
