// include/tether/budget/budget_tracker.h
#ifndef TETHER_BUDGET_BUDGET_TRACKER_H
#define TETHER_BUDGET_BUDGET_TRACKER_H

#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether {

// One committed call. Never mutated once appended.
struct CallRecord {
    int input_tokens = 0;
    int output_tokens = 0;
    std::string model;
    double cost_usd = 0.0;
    double duration_ms = 0.0;
};

// Point-in-time copy of a tracker's state
struct BudgetSummary {
    std::string run_id;
    double budget_usd = 0.0;
    double spent_usd = 0.0;
    double remaining_usd = 0.0;
    int turn_count = 0;
    std::vector<CallRecord> calls;

    nlohmann::json to_json() const;
};

// BudgetTracker is the per-run ledger.
//
// pre_check() is the admission gate and never mutates; record_call() is the
// commit and never rejects on cost (it clamps spend to the ceiling instead).
// Every reader and mutator goes through the same mutex, so concurrent callers
// in one run never see a torn state.
class BudgetTracker {
public:
    BudgetTracker(std::string run_id, double max_usd, std::optional<int> max_turns = std::nullopt);

    BudgetTracker(const BudgetTracker&) = delete;
    BudgetTracker& operator=(const BudgetTracker&) = delete;

    const std::string& run_id() const { return run_id_; }
    double max_usd() const { return max_usd_; }
    std::optional<int> max_turns() const { return max_turns_; }

    double spent_usd() const;
    double remaining_usd() const;
    int turn_count() const;
    bool is_exceeded() const;

    // Throws BudgetExceededError when spent + estimated_cost >= max_usd
    void pre_check(double estimated_cost, const std::string& model = "unknown") const;

    // Throws std::invalid_argument for a negative cost and TurnLimitError when
    // max_turns commits already happened; in both cases nothing changes.
    void record_call(int input_tokens, int output_tokens, const std::string& model, double cost_usd,
                     double duration_ms);

    BudgetSummary summary() const;

private:
    const std::string run_id_;
    const double max_usd_;
    const std::optional<int> max_turns_;

    mutable std::mutex mutex_;
    double spent_usd_ = 0.0;
    int turn_count_ = 0;
    std::vector<CallRecord> calls_;
};

} // namespace tether

#endif // TETHER_BUDGET_BUDGET_TRACKER_H
