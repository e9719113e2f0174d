// src/budget/budget_tracker.cpp
#include "tether/budget/budget_tracker.h"
#include "tether/common/errors.h"
#include <algorithm>
#include <stdexcept>

namespace tether {

nlohmann::json BudgetSummary::to_json() const {
    nlohmann::json obj;
    obj["run_id"] = run_id;
    obj["budget_usd"] = budget_usd;
    obj["spent_usd"] = spent_usd;
    obj["remaining_usd"] = remaining_usd;
    obj["turn_count"] = turn_count;

    nlohmann::json records = nlohmann::json::array();
    for (const auto& call : calls) {
        records.push_back({
            {"input_tokens", call.input_tokens},
            {"output_tokens", call.output_tokens},
            {"model", call.model},
            {"cost_usd", call.cost_usd},
            {"duration_ms", call.duration_ms},
        });
    }
    obj["calls"] = std::move(records);
    return obj;
}

BudgetTracker::BudgetTracker(std::string run_id, double max_usd, std::optional<int> max_turns)
    : run_id_(std::move(run_id)), max_usd_(max_usd), max_turns_(max_turns) {
    if (max_usd_ < 0) {
        throw std::invalid_argument("max_usd must be non-negative");
    }
    if (max_turns_.has_value() && *max_turns_ < 0) {
        throw std::invalid_argument("max_turns must be non-negative");
    }
}

double BudgetTracker::spent_usd() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spent_usd_;
}

double BudgetTracker::remaining_usd() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::max(0.0, max_usd_ - spent_usd_);
}

int BudgetTracker::turn_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return turn_count_;
}

bool BudgetTracker::is_exceeded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return spent_usd_ >= max_usd_;
}

void BudgetTracker::pre_check(double estimated_cost, const std::string& model) const {
    std::lock_guard<std::mutex> lock(mutex_);
    double projected = spent_usd_ + estimated_cost;
    if (projected >= max_usd_) {
        throw BudgetExceededError(run_id_, max_usd_, projected, model);
    }
}

void BudgetTracker::record_call(int input_tokens, int output_tokens, const std::string& model, double cost_usd,
                                double duration_ms) {
    if (cost_usd < 0) {
        throw std::invalid_argument("cost_usd must be non-negative");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (max_turns_.has_value() && turn_count_ >= *max_turns_) {
        throw TurnLimitError(run_id_, *max_turns_, turn_count_ + 1);
    }

    spent_usd_ += cost_usd;
    turn_count_ += 1;
    if (spent_usd_ > max_usd_) {
        spent_usd_ = max_usd_;
    }
    calls_.push_back(CallRecord{input_tokens, output_tokens, model, cost_usd, duration_ms});
}

BudgetSummary BudgetTracker::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    BudgetSummary s;
    s.run_id = run_id_;
    s.budget_usd = max_usd_;
    s.spent_usd = spent_usd_;
    s.remaining_usd = std::max(0.0, max_usd_ - spent_usd_);
    s.turn_count = turn_count_;
    s.calls = calls_;
    return s;
}

} // namespace tether
