// src/core/circuit_breaker.cpp
#include "tether/core/circuit_breaker.h"
#include "tether/common/utils.h"
#include <stdexcept>

namespace tether {

namespace {

std::unique_ptr<TokenCounter> make_counter(const TetherConfig& config) {
    try {
        return std::make_unique<TokenCounter>(config.token_counter_backend, config.tokenizer_vocab_path);
    } catch (const TokenCountError& e) {
        log_warning(std::string(e.what()) + "; using local tokenizer");
        return std::make_unique<TokenCounter>(TokenCounterBackend::LOCAL);
    }
}

std::unique_ptr<PricingRegistry> make_pricing(const TetherConfig& config) {
    std::shared_ptr<const PricingSource> external;
    if (config.pricing_source == PricingSourceKind::EXTERNAL && !config.pricing_file.empty()) {
        try {
            external = JsonPricingSource::from_file(config.pricing_file);
        } catch (const std::exception& e) {
            log_warning(std::string("External pricing unavailable: ") + e.what());
        }
    }
    return std::make_unique<PricingRegistry>(config.pricing_source, std::move(external));
}

} // namespace

const char* to_string(RunState state) {
    switch (state) {
        case RunState::IDLE: return "idle";
        case RunState::ARMED: return "armed";
        case RunState::EXECUTING: return "executing";
        case RunState::COMPLETED: return "completed";
        case RunState::ABORTED: return "aborted";
        case RunState::TORN_DOWN: return "torn_down";
    }
    return "idle";
}

RunScope::RunScope(const BudgetOptions& options)
    : config_(options.config ? *options.config : load_config()),
      run_id_(generate_run_id()),
      observer_(options.on_state_change) {
    if (options.unlimited_turns && options.max_turns.has_value()) {
        throw std::invalid_argument("max_turns and unlimited_turns are mutually exclusive");
    }
    config_.validate();
    configure_logging(config_);

    double max_usd = options.max_usd.value_or(config_.default_budget_usd);
    std::optional<int> max_turns;
    if (!options.unlimited_turns) {
        max_turns = options.max_turns.value_or(config_.default_max_turns);
    }

    tracker_ = std::make_unique<BudgetTracker>(run_id_, max_usd, max_turns);
    counter_ = make_counter(config_);
    pricing_ = make_pricing(config_);
    collector_ = std::make_unique<TraceCollector>();
    interceptor_ = std::make_unique<Interceptor>(*tracker_, *counter_, *pricing_, *collector_, options.interceptor);

    TraceExportKind export_kind = options.trace_export.value_or(config_.trace_export);
    if (export_kind != TraceExportKind::NONE) {
        exporter_ = options.exporter ? options.exporter
                                     : std::shared_ptr<TraceExporter>(
                                           make_exporter(export_kind, config_.trace_export_path));
    }

    collector_->start_trace(run_id_, tracker_->summary().to_json());

    CallInterceptionPoint& point =
        options.interception_point ? *options.interception_point : CompletionHook::instance();
    try {
        interceptor_->activate(point);
    } catch (const TetherError&) {
        // the destructor will not run for a half-built scope
        collector_->end_trace();
        state_ = RunState::TORN_DOWN;
        throw;
    }

    log_debug("Run " + run_id_ + " armed with budget $" + std::to_string(max_usd));
    set_state(RunState::ARMED);
}

RunScope::~RunScope() {
    tear_down();
}

void RunScope::set_state(RunState state) {
    state_ = state;
    if (observer_) {
        observer_(state);
    }
}

void RunScope::tear_down() noexcept {
    interceptor_->deactivate();

    try {
        std::optional<Trace> trace = collector_->end_trace();
        if (trace && exporter_) {
            try {
                exporter_->export_trace(*trace);
            } catch (const std::exception& e) {
                log_warning("Trace export failed for run " + run_id_ + ": " + e.what());
            }
        }
        set_state(RunState::TORN_DOWN);
    } catch (const std::exception& e) {
        state_ = RunState::TORN_DOWN;
        log_error("Teardown of run " + run_id_ + " incomplete: " + e.what());
    }
}

} // namespace tether
