// include/tether/interceptor/interceptor.h
#ifndef TETHER_INTERCEPTOR_INTERCEPTOR_H
#define TETHER_INTERCEPTOR_INTERCEPTOR_H

#include "tether/budget/budget_tracker.h"
#include "tether/common/types.h"
#include "tether/interceptor/completion_hook.h"
#include "tether/pricing/pricing_registry.h"
#include "tether/tokens/token_counter.h"
#include "tether/trace/trace.h"
#include <chrono>
#include <future>
#include <string>

namespace tether {

struct InterceptorOptions {
    // Projected output tokens = input tokens * output_multiplier, used only for
    // the admission estimate. A rough guess: tune it per workload.
    double output_multiplier = 1.0;
};

// Meters one call at a time against a run's ledger:
// estimate -> pre_check -> span -> invoke -> commit actual usage -> update span.
//
// All collaborators are borrowed and must outlive the interceptor (and any
// future returned by intercept_async).
class Interceptor {
public:
    Interceptor(BudgetTracker& tracker,
                TokenCounter& counter,
                PricingRegistry& pricing,
                TraceCollector& collector,
                InterceptorOptions options = {});
    ~Interceptor();

    Interceptor(const Interceptor&) = delete;
    Interceptor& operator=(const Interceptor&) = delete;

    // Installs this interceptor on `point`. Only one interceptor may be active
    // per process; a second activation throws TetherError.
    void activate(CallInterceptionPoint& point = CompletionHook::instance());

    // Restores the previous handlers. Safe to call repeatedly.
    void deactivate() noexcept;

    bool is_active() const { return point_ != nullptr; }

    // BudgetExceededError from the admission check propagates before `invoke`
    // runs and before any span exists. Exceptions from `invoke` propagate
    // unchanged after the span is marked as an error; nothing is charged.
    nlohmann::json intercept(const CallRequest& request, const CompletionFn& invoke);

    // Admission happens on the calling thread; the returned future completes
    // after the wrapped future and the ledger commit.
    std::future<nlohmann::json> intercept_async(const CallRequest& request, const AsyncCompletionFn& invoke);

    // For usage known without an intercepted call
    void track_call(const std::string& model, int input_tokens, int output_tokens);

    const InterceptorOptions& options() const { return options_; }

private:
    struct PendingCall {
        std::string span_id;
        std::string model;
        int estimated_input_tokens = 0;
        int estimated_output_tokens = 0;
        std::chrono::steady_clock::time_point started;
    };

    PendingCall begin_call(const CallRequest& request);
    void fail_call(const PendingCall& call);
    nlohmann::json complete_call(const PendingCall& call, nlohmann::json response);
    double elapsed_ms(const PendingCall& call) const;

    BudgetTracker& tracker_;
    TokenCounter& counter_;
    PricingRegistry& pricing_;
    TraceCollector& collector_;
    InterceptorOptions options_;

    CallInterceptionPoint* point_ = nullptr;
    CallInterceptionPoint::Handlers previous_;
};

// RAII activate/deactivate
class ScopedActivation {
public:
    explicit ScopedActivation(Interceptor& interceptor,
                              CallInterceptionPoint& point = CompletionHook::instance())
        : interceptor_(interceptor) {
        interceptor_.activate(point);
    }
    ~ScopedActivation() { interceptor_.deactivate(); }

    ScopedActivation(const ScopedActivation&) = delete;
    ScopedActivation& operator=(const ScopedActivation&) = delete;

private:
    Interceptor& interceptor_;
};

} // namespace tether

#endif // TETHER_INTERCEPTOR_INTERCEPTOR_H
