// src/common/errors.cpp
#include "tether/common/errors.h"
#include <iomanip>
#include <sstream>

namespace tether {

namespace {

std::string format_budget_message(const std::string& run_id, double budget_usd, double spent_usd) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << "Budget exceeded: $" << spent_usd << " / $" << budget_usd << " on run " << run_id;
    return oss.str();
}

} // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BUDGET_EXCEEDED: return "budget_exceeded";
        case ErrorKind::TURN_LIMIT_EXCEEDED: return "turn_limit_exceeded";
        case ErrorKind::TOKEN_COUNT_FAILURE: return "token_count_failure";
        case ErrorKind::UNKNOWN_MODEL: return "unknown_model";
        case ErrorKind::GENERIC:
        default: return "generic";
    }
}

BudgetExceededError::BudgetExceededError(std::string run_id, double budget_usd, double spent_usd, std::string last_model)
    : TetherError(format_budget_message(run_id, budget_usd, spent_usd), ErrorKind::BUDGET_EXCEEDED),
      run_id_(std::move(run_id)),
      budget_usd_(budget_usd),
      spent_usd_(spent_usd),
      last_model_(std::move(last_model)) {}

TurnLimitError::TurnLimitError(std::string run_id, int max_turns, int current_turn)
    : TetherError("Turn limit exceeded: " + std::to_string(current_turn) + " / " + std::to_string(max_turns) +
                      " on run " + run_id,
                  ErrorKind::TURN_LIMIT_EXCEEDED),
      run_id_(std::move(run_id)),
      max_turns_(max_turns),
      current_turn_(current_turn) {}

} // namespace tether
