// src/interceptor/interceptor.cpp
#include "tether/interceptor/interceptor.h"
#include "tether/common/errors.h"
#include "tether/common/logging.h"
#include <atomic>
#include <cmath>
#include <optional>

namespace tether {

namespace {

// The process-wide activation guard
std::atomic<const Interceptor*> g_active_interceptor{nullptr};

std::optional<std::string> first_message_content(const nlohmann::json& messages) {
    if (!messages.is_array() || messages.empty()) return std::nullopt;
    const auto& first = messages.front();
    if (!first.is_object() || !first.contains("content")) return std::nullopt;
    const auto& content = first["content"];
    if (content.is_string()) return content.get<std::string>();
    if (content.is_null()) return std::nullopt;
    return content.dump();
}

// choices[0].message.content, when present
std::optional<std::string> response_content(const nlohmann::json& response) {
    if (!response.is_object() || !response.contains("choices")) return std::nullopt;
    const auto& choices = response["choices"];
    if (!choices.is_array() || choices.empty() || !choices[0].is_object()) return std::nullopt;
    const auto& choice = choices[0];
    if (!choice.contains("message") || !choice["message"].is_object()) return std::nullopt;
    const auto& message = choice["message"];
    if (!message.contains("content") || !message["content"].is_string()) return std::nullopt;
    std::string content = message["content"].get<std::string>();
    if (content.empty()) return std::nullopt;
    return content;
}

std::optional<int> usage_field(const nlohmann::json& response, const char* key) {
    if (!response.is_object() || !response.contains("usage")) return std::nullopt;
    const auto& usage = response["usage"];
    if (!usage.is_object() || !usage.contains(key) || !usage[key].is_number_integer()) return std::nullopt;
    return usage[key].get<int>();
}

} // namespace

Interceptor::Interceptor(BudgetTracker& tracker,
                         TokenCounter& counter,
                         PricingRegistry& pricing,
                         TraceCollector& collector,
                         InterceptorOptions options)
    : tracker_(tracker), counter_(counter), pricing_(pricing), collector_(collector), options_(options) {
    if (options_.output_multiplier < 0) {
        throw std::invalid_argument("output_multiplier must be non-negative");
    }
}

Interceptor::~Interceptor() {
    deactivate();
}

void Interceptor::activate(CallInterceptionPoint& point) {
    const Interceptor* expected = nullptr;
    if (!g_active_interceptor.compare_exchange_strong(expected, this)) {
        if (expected == this) {
            throw TetherError("Interceptor is already active");
        }
        throw TetherError("Another interceptor is already active in this process");
    }

    CallInterceptionPoint::Handlers handlers;
    handlers.sync = [this](const CallRequest& request, const CompletionFn& invoke) {
        return intercept(request, invoke);
    };
    handlers.async = [this](const CallRequest& request, const AsyncCompletionFn& invoke) {
        return intercept_async(request, invoke);
    };

    try {
        previous_ = point.install(std::move(handlers));
    } catch (const std::exception&) {
        g_active_interceptor.store(nullptr);
        throw;
    }
    point_ = &point;
    log_debug("Interceptor activated for run " + tracker_.run_id());
}

void Interceptor::deactivate() noexcept {
    if (point_ == nullptr) {
        return;
    }
    point_->restore(std::move(previous_));
    previous_ = {};
    point_ = nullptr;

    const Interceptor* expected = this;
    g_active_interceptor.compare_exchange_strong(expected, nullptr);
}

double Interceptor::elapsed_ms(const PendingCall& call) const {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - call.started).count();
}

Interceptor::PendingCall Interceptor::begin_call(const CallRequest& request) {
    PendingCall call;
    call.model = request.model;
    call.started = std::chrono::steady_clock::now();

    try {
        call.estimated_input_tokens = counter_.count_messages(request.messages, call.model);
    } catch (const std::exception& e) {
        log_warning("Token estimate failed for " + call.model + ": " + e.what() + "; assuming 0 tokens");
        call.estimated_input_tokens = 0;
    }
    call.estimated_output_tokens =
        static_cast<int>(std::lround(call.estimated_input_tokens * options_.output_multiplier));

    double estimated_cost = 0.0;
    try {
        estimated_cost =
            pricing_.estimate_call_cost(call.model, call.estimated_input_tokens, call.estimated_output_tokens);
    } catch (const UnknownModelError& e) {
        log_warning(std::string(e.what()) + "; admission estimate is 0");
    }

    tracker_.pre_check(estimated_cost, call.model);

    Span span;
    span.run_id = tracker_.run_id();
    span.span_type = "llm_call";
    span.model = call.model;
    span.input_tokens = call.estimated_input_tokens;
    span.status = SpanStatus::PENDING;
    span.metadata["estimated_input_tokens"] = call.estimated_input_tokens;
    span.metadata["estimated_output_tokens"] = call.estimated_output_tokens;
    span.metadata["estimated_cost_usd"] = estimated_cost;
    if (auto preview = first_message_content(request.messages)) {
        span.set_input_preview(*preview);
    }
    call.span_id = span.span_id;
    collector_.add_span(std::move(span));
    return call;
}

void Interceptor::fail_call(const PendingCall& call) {
    double duration = elapsed_ms(call);
    collector_.update_span(call.span_id, [duration](Span& span) {
        span.status = SpanStatus::ERROR;
        span.duration_ms = duration;
    });
}

nlohmann::json Interceptor::complete_call(const PendingCall& call, nlohmann::json response) {
    double duration = elapsed_ms(call);

    // actual usage when the response reports it, the pre-call estimates otherwise
    int input_tokens = call.estimated_input_tokens;
    int output_tokens = call.estimated_output_tokens;
    if (response.is_object() && response.contains("usage") && response["usage"].is_object()) {
        input_tokens = usage_field(response, "prompt_tokens").value_or(call.estimated_input_tokens);
        output_tokens = usage_field(response, "completion_tokens").value_or(0);
    }

    double cost = 0.0;
    try {
        cost = pricing_.estimate_call_cost(call.model, input_tokens, output_tokens);
    } catch (const UnknownModelError& e) {
        log_warning(std::string(e.what()) + "; recording call at $0");
    }

    std::optional<std::string> content = response_content(response);
    collector_.update_span(call.span_id, [&](Span& span) {
        span.input_tokens = input_tokens;
        span.output_tokens = output_tokens;
        span.cost_usd = cost;
        span.duration_ms = duration;
        span.status = SpanStatus::OK;
        if (content) {
            span.set_output_preview(*content);
        }
    });

    try {
        tracker_.record_call(input_tokens, output_tokens, call.model, cost, duration);
    } catch (const TetherError& e) {
        collector_.update_span(call.span_id, [&e](Span& span) {
            span.status = SpanStatus::ERROR;
            span.metadata["ledger_rejected"] = error_kind_name(e.kind());
        });
        throw;
    }
    return response;
}

nlohmann::json Interceptor::intercept(const CallRequest& request, const CompletionFn& invoke) {
    if (!invoke) {
        throw TetherError("Interceptor has no call to wrap");
    }
    PendingCall call = begin_call(request);

    nlohmann::json response;
    try {
        response = invoke(request);
    } catch (...) {
        fail_call(call);
        throw;
    }
    return complete_call(call, std::move(response));
}

std::future<nlohmann::json> Interceptor::intercept_async(const CallRequest& request, const AsyncCompletionFn& invoke) {
    if (!invoke) {
        throw TetherError("Interceptor has no call to wrap");
    }
    PendingCall call = begin_call(request);

    std::future<nlohmann::json> pending;
    try {
        pending = invoke(request);
    } catch (...) {
        fail_call(call);
        throw;
    }

    // no lock is held while waiting on the wrapped call
    return std::async(std::launch::async, [this, call = std::move(call), pending = std::move(pending)]() mutable {
        nlohmann::json response;
        try {
            response = pending.get();
        } catch (...) {
            fail_call(call);
            throw;
        }
        return complete_call(call, std::move(response));
    });
}

void Interceptor::track_call(const std::string& model, int input_tokens, int output_tokens) {
    double cost = pricing_.estimate_call_cost(model, input_tokens, output_tokens);
    tracker_.pre_check(pricing_.input_cost(model) * input_tokens / 1000.0, model);
    tracker_.record_call(input_tokens, output_tokens, model, cost, 0.0);

    Span span;
    span.run_id = tracker_.run_id();
    span.span_type = "llm_call";
    span.model = model;
    span.input_tokens = input_tokens;
    span.output_tokens = output_tokens;
    span.cost_usd = cost;
    span.status = SpanStatus::OK;
    collector_.add_span(std::move(span));
}

} // namespace tether
