// include/tether/trace/trace.h
#ifndef TETHER_TRACE_TRACE_H
#define TETHER_TRACE_TRACE_H

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether {

constexpr size_t kMaxPreviewLength = 200; // characters (UTF-8 code points)

enum class SpanStatus : uint8_t {
    PENDING, // in flight
    OK,
    ERROR
};

const char* to_string(SpanStatus status);
SpanStatus parse_span_status(const std::string& name);

// Cuts previews longer than kMaxPreviewLength characters to that many and
// appends "..."
std::string truncate_preview(const std::string& text);

// One observed call attempt
struct Span {
    Span();

    std::string span_id;
    std::optional<std::string> parent_span_id;
    std::string run_id;
    std::chrono::system_clock::time_point timestamp;
    double duration_ms = 0.0;
    std::string span_type = "call";
    std::optional<std::string> model;
    std::optional<int> input_tokens;
    std::optional<int> output_tokens;
    std::optional<double> cost_usd;
    SpanStatus status = SpanStatus::OK;
    nlohmann::json metadata = nlohmann::json::object();

    void set_input_preview(const std::string& text) { input_preview_ = truncate_preview(text); }
    void set_output_preview(const std::string& text) { output_preview_ = truncate_preview(text); }
    void clear_input_preview() { input_preview_.reset(); }
    void clear_output_preview() { output_preview_.reset(); }
    const std::optional<std::string>& input_preview() const { return input_preview_; }
    const std::optional<std::string>& output_preview() const { return output_preview_; }

private:
    std::optional<std::string> input_preview_;
    std::optional<std::string> output_preview_;
};

// One run's spans in chronological order
struct Trace {
    std::string run_id;
    std::vector<Span> spans;
    nlohmann::json budget_summary = nlohmann::json::object();
    std::chrono::system_clock::time_point start_time = std::chrono::system_clock::now();
    std::optional<std::chrono::system_clock::time_point> end_time;

    void add_span(Span span) { spans.push_back(std::move(span)); }

    double total_cost() const;
    int64_t total_input_tokens() const;
    int64_t total_output_tokens() const;
};

nlohmann::json span_to_json(const Span& span);
Span span_from_json(const nlohmann::json& j);

// {run_id, spans, budget_summary, start_time, end_time, total_cost,
//  total_input_tokens, total_output_tokens}
nlohmann::json trace_to_json(const Trace& trace);
Trace trace_from_json(const nlohmann::json& j);

// Owns the active trace of a run. Thread-safe; concurrent calls of one run
// add and update spans through the same collector.
class TraceCollector {
public:
    // Throws TetherError if a trace is already active
    void start_trace(const std::string& run_id, nlohmann::json budget_summary = nlohmann::json::object());

    // Dropped silently when no trace is active
    void add_span(Span span);

    // Applies `update` to an in-flight span; false if the span (or the trace) is gone
    bool update_span(const std::string& span_id, const std::function<void(Span&)>& update);

    // Stamps end_time and hands the trace over; nullopt when nothing is active
    std::optional<Trace> end_trace();

    bool has_active_trace() const;
    std::optional<Trace> current_trace() const;

private:
    mutable std::mutex mutex_;
    std::optional<Trace> current_;
};

} // namespace tether

#endif // TETHER_TRACE_TRACE_H
