// budget_demo.cpp
#include <iostream>
#include <nlohmann/json.hpp>
#include "tether/core/circuit_breaker.h"

// A stand-in provider: every reply reports 1200 prompt and 400 completion tokens
static nlohmann::json fake_provider(const tether::CallRequest& request) {
    return {
        {"model", request.model},
        {"choices", {{{"message", {{"role", "assistant"}, {"content", "Next step planned."}}}}}},
        {"usage", {{"prompt_tokens", 1200}, {"completion_tokens", 400}}},
    };
}

int main(int argc, char* argv[]) {
    int steps = 0;

    try {
        double budget = argc > 1 ? std::stod(argv[1]) : 0.05;
        tether::CompletionHook::instance().set_backend(fake_provider);

        tether::BudgetOptions options;
        options.max_usd = budget;
        options.max_turns = 100;
        options.trace_export = tether::TraceExportKind::CONSOLE;

        tether::enforce_budget(options, [&steps](tether::RunScope& scope) {
            tether::CallRequest request;
            request.model = "gpt-4o";
            request.messages = nlohmann::json::array({
                {{"role", "system"}, {"content", "You are a planning agent."}},
                {{"role", "user"}, {"content", "Plan the next step."}},
            });

            // runs until the budget stops it
            while (true) {
                auto reply = tether::CompletionHook::instance().complete(request);
                ++steps;
                std::cout << "[step " << steps << "] " << reply["choices"][0]["message"]["content"].get<std::string>()
                          << " spent $" << scope.tracker().spent_usd() << "\n";
            }
        });
    } catch (const tether::BudgetExceededError& e) {
        std::cerr << "[STOPPED] after " << steps << " steps: " << e.what() << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[FATAL] " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
