// include/tether/core/circuit_breaker.h
#ifndef TETHER_CORE_CIRCUIT_BREAKER_H
#define TETHER_CORE_CIRCUIT_BREAKER_H

#include "tether/budget/budget_tracker.h"
#include "tether/common/errors.h"
#include "tether/common/logging.h"
#include "tether/config/config.h"
#include "tether/interceptor/interceptor.h"
#include "tether/pricing/pricing_registry.h"
#include "tether/tokens/token_counter.h"
#include "tether/trace/trace.h"
#include "tether/trace/trace_exporter.h"
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace tether {

enum class ExceedPolicy : uint8_t {
    RAISE,      // rethrow BudgetExceededError
    RETURN_NONE // swallow it and return an empty result
};

// idle -> armed -> executing -> completed | aborted -> torn_down
enum class RunState : uint8_t {
    IDLE,
    ARMED,
    EXECUTING,
    COMPLETED,
    ABORTED,
    TORN_DOWN
};

const char* to_string(RunState state);

struct BudgetOptions {
    std::optional<double> max_usd;  // config default_budget_usd when unset
    std::optional<int> max_turns;   // config default_max_turns when unset
    bool unlimited_turns = false;   // no turn limit at all; excludes max_turns
    ExceedPolicy on_exceed = ExceedPolicy::RAISE;
    std::optional<TraceExportKind> trace_export; // config trace_export when unset
    std::shared_ptr<TraceExporter> exporter;     // replaces the configured sink unless export is NONE
    CallInterceptionPoint* interception_point = nullptr; // CompletionHook::instance() when null
    InterceptorOptions interceptor;
    std::optional<TetherConfig> config;          // load_config() when unset
    std::function<void(RunState)> on_state_change;
};

// Everything one run owns. Construction arms the run; destruction tears it
// down (restore hooks, close the trace, export) on every exit path.
class RunScope {
public:
    explicit RunScope(const BudgetOptions& options);
    ~RunScope();

    RunScope(const RunScope&) = delete;
    RunScope& operator=(const RunScope&) = delete;

    const std::string& run_id() const { return run_id_; }
    const TetherConfig& config() const { return config_; }
    RunState state() const { return state_; }
    void set_state(RunState state);

    BudgetTracker& tracker() { return *tracker_; }
    TokenCounter& counter() { return *counter_; }
    PricingRegistry& pricing() { return *pricing_; }
    TraceCollector& collector() { return *collector_; }
    Interceptor& interceptor() { return *interceptor_; }

private:
    void tear_down() noexcept;

    TetherConfig config_;
    std::string run_id_;
    std::unique_ptr<BudgetTracker> tracker_;
    std::unique_ptr<TokenCounter> counter_;
    std::unique_ptr<PricingRegistry> pricing_;
    std::unique_ptr<TraceCollector> collector_;
    std::unique_ptr<Interceptor> interceptor_;
    std::shared_ptr<TraceExporter> exporter_;
    std::function<void(RunState)> observer_;
    RunState state_ = RunState::IDLE;
};

namespace detail {

template <typename T>
struct is_future : std::false_type {};
template <typename T>
struct is_future<std::future<T>> : std::true_type {};

template <typename T>
struct unwrap_future { using type = T; };
template <typename T>
struct unwrap_future<std::future<T>> { using type = T; };

// Work may take the RunScope (for track_call and friends) or nothing
template <typename Work>
decltype(auto) invoke_work(Work& work, RunScope& scope) {
    if constexpr (std::is_invocable_v<Work&, RunScope&>) {
        return std::invoke(work, scope);
    } else {
        return std::invoke(work);
    }
}

template <typename Work>
using raw_result_t = std::decay_t<decltype(invoke_work(std::declval<Work&>(), std::declval<RunScope&>()))>;

template <typename Work>
using value_result_t = typename unwrap_future<raw_result_t<Work>>::type;

} // namespace detail

// std::optional<T> for work returning T (or std::future<T>); bool for void work.
// Empty / false means the budget was exceeded under ExceedPolicy::RETURN_NONE.
template <typename T>
struct RunResult { using type = std::optional<T>; };
template <>
struct RunResult<void> { using type = bool; };

template <typename Work>
using run_result_t = typename RunResult<detail::value_result_t<Work>>::type;

class CircuitBreaker {
public:
    explicit CircuitBreaker(BudgetOptions options = {}) : options_(std::move(options)) {}

    template <typename Work>
    run_result_t<Work> run(Work&& work) const {
        return execute(options_, work);
    }

    // The whole run (arm, work, teardown) happens on a separate task
    template <typename Work>
    std::future<run_result_t<Work>> run_async(Work work) const {
        return std::async(std::launch::async, [options = options_, work = std::move(work)]() mutable {
            return execute(options, work);
        });
    }

    const BudgetOptions& options() const { return options_; }

private:
    template <typename Work>
    static run_result_t<Work> execute(const BudgetOptions& options, Work& work);

    BudgetOptions options_;
};

template <typename Work>
run_result_t<Work> CircuitBreaker::execute(const BudgetOptions& options, Work& work) {
    using Raw = detail::raw_result_t<Work>;
    using Value = detail::value_result_t<Work>;
    using Result = run_result_t<Work>;

    RunScope scope(options);
    try {
        scope.set_state(RunState::EXECUTING);
        if constexpr (std::is_void_v<Raw>) {
            detail::invoke_work(work, scope);
            scope.set_state(RunState::COMPLETED);
            return true;
        } else if constexpr (detail::is_future<Raw>::value) {
            Raw pending = detail::invoke_work(work, scope);
            if constexpr (std::is_void_v<Value>) {
                pending.get();
                scope.set_state(RunState::COMPLETED);
                return true;
            } else {
                Result result(pending.get());
                scope.set_state(RunState::COMPLETED);
                return result;
            }
        } else {
            Result result(detail::invoke_work(work, scope));
            scope.set_state(RunState::COMPLETED);
            return result;
        }
    } catch (const BudgetExceededError& e) {
        scope.set_state(RunState::ABORTED);
        if (options.on_exceed == ExceedPolicy::RETURN_NONE) {
            log_info("Run " + scope.run_id() + " stopped: " + e.what());
            return Result{};
        }
        throw;
    } catch (...) {
        scope.set_state(RunState::ABORTED);
        throw;
    }
}

template <typename Work>
run_result_t<Work> enforce_budget(const BudgetOptions& options, Work&& work) {
    return CircuitBreaker(options).run(std::forward<Work>(work));
}

} // namespace tether

#endif // TETHER_CORE_CIRCUIT_BREAKER_H
