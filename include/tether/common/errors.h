// include/tether/common/errors.h
#ifndef TETHER_COMMON_ERRORS_H
#define TETHER_COMMON_ERRORS_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace tether {

enum class ErrorKind : uint8_t {
    GENERIC,
    BUDGET_EXCEEDED,
    TURN_LIMIT_EXCEEDED,
    TOKEN_COUNT_FAILURE,
    UNKNOWN_MODEL
};

const char* error_kind_name(ErrorKind kind);

// Base of every error raised by tether itself
class TetherError : public std::runtime_error {
public:
    explicit TetherError(const std::string& message, ErrorKind kind = ErrorKind::GENERIC)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Admission (or commit) would breach the run's dollar ceiling
class BudgetExceededError : public TetherError {
public:
    BudgetExceededError(std::string run_id, double budget_usd, double spent_usd, std::string last_model);

    const std::string& run_id() const { return run_id_; }
    double budget_usd() const { return budget_usd_; }
    double spent_usd() const { return spent_usd_; }
    const std::string& last_model() const { return last_model_; }

private:
    std::string run_id_;
    double budget_usd_;
    double spent_usd_; // projected spend at the moment of rejection
    std::string last_model_;
};

// Call count reached the run's max_turns
class TurnLimitError : public TetherError {
public:
    TurnLimitError(std::string run_id, int max_turns, int current_turn);

    const std::string& run_id() const { return run_id_; }
    int max_turns() const { return max_turns_; }
    int current_turn() const { return current_turn_; }

private:
    std::string run_id_;
    int max_turns_;
    int current_turn_;
};

// Token estimation backend failure. Recovered locally on the call path.
class TokenCountError : public TetherError {
public:
    explicit TokenCountError(const std::string& message, std::optional<std::string> model = std::nullopt)
        : TetherError(message, ErrorKind::TOKEN_COUNT_FAILURE), model_(std::move(model)) {}

    const std::optional<std::string>& model() const { return model_; }

private:
    std::optional<std::string> model_;
};

class UnknownModelError : public TetherError {
public:
    UnknownModelError(const std::string& message, std::string model)
        : TetherError(message, ErrorKind::UNKNOWN_MODEL), model_(std::move(model)) {}

    const std::string& model() const { return model_; }

private:
    std::string model_;
};

} // namespace tether

#endif // TETHER_COMMON_ERRORS_H
