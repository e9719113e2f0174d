// src/trace/trace.cpp
#include "tether/trace/trace.h"
#include "tether/common/errors.h"
#include "tether/common/utils.h"
#include <stdexcept>

namespace tether {

namespace {

template <typename T>
nlohmann::json optional_to_json(const std::optional<T>& value) {
    if (!value.has_value()) return nullptr;
    return *value;
}

template <typename T>
std::optional<T> optional_from_json(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    return j[key].get<T>();
}

} // namespace

const char* to_string(SpanStatus status) {
    switch (status) {
        case SpanStatus::PENDING: return "pending";
        case SpanStatus::OK: return "ok";
        case SpanStatus::ERROR: return "error";
    }
    return "ok";
}

SpanStatus parse_span_status(const std::string& name) {
    if (name == "ok") return SpanStatus::OK;
    if (name == "error") return SpanStatus::ERROR;
    if (name == "pending") return SpanStatus::PENDING;
    throw std::invalid_argument("Unknown span status: " + name);
}

std::string truncate_preview(const std::string& text) {
    if (utf8_length(text) <= kMaxPreviewLength) {
        return text;
    }
    return utf8_prefix(text, kMaxPreviewLength) + "...";
}

Span::Span() : span_id(generate_hex_id(16)), timestamp(std::chrono::system_clock::now()) {}

double Trace::total_cost() const {
    double total = 0.0;
    for (const auto& span : spans) {
        total += span.cost_usd.value_or(0.0);
    }
    return total;
}

int64_t Trace::total_input_tokens() const {
    int64_t total = 0;
    for (const auto& span : spans) {
        total += span.input_tokens.value_or(0);
    }
    return total;
}

int64_t Trace::total_output_tokens() const {
    int64_t total = 0;
    for (const auto& span : spans) {
        total += span.output_tokens.value_or(0);
    }
    return total;
}

nlohmann::json span_to_json(const Span& span) {
    nlohmann::json obj;
    obj["span_id"] = span.span_id;
    obj["parent_span_id"] = optional_to_json(span.parent_span_id);
    obj["run_id"] = span.run_id;
    obj["timestamp"] = format_iso8601(span.timestamp);
    obj["duration_ms"] = span.duration_ms;
    obj["span_type"] = span.span_type;
    obj["model"] = optional_to_json(span.model);
    obj["input_tokens"] = optional_to_json(span.input_tokens);
    obj["output_tokens"] = optional_to_json(span.output_tokens);
    obj["cost_usd"] = optional_to_json(span.cost_usd);
    obj["status"] = to_string(span.status);
    obj["metadata"] = span.metadata;
    obj["input_preview"] = optional_to_json(span.input_preview());
    obj["output_preview"] = optional_to_json(span.output_preview());
    return obj;
}

Span span_from_json(const nlohmann::json& j) {
    Span span;
    span.span_id = j.at("span_id").get<std::string>();
    span.parent_span_id = optional_from_json<std::string>(j, "parent_span_id");
    span.run_id = j.value("run_id", "");
    span.timestamp = parse_iso8601(j.at("timestamp").get<std::string>());
    span.duration_ms = j.value("duration_ms", 0.0);
    span.span_type = j.value("span_type", "call");
    span.model = optional_from_json<std::string>(j, "model");
    span.input_tokens = optional_from_json<int>(j, "input_tokens");
    span.output_tokens = optional_from_json<int>(j, "output_tokens");
    span.cost_usd = optional_from_json<double>(j, "cost_usd");
    span.status = parse_span_status(j.value("status", "ok"));
    if (j.contains("metadata") && j["metadata"].is_object()) {
        span.metadata = j["metadata"];
    }
    if (auto preview = optional_from_json<std::string>(j, "input_preview")) {
        span.set_input_preview(*preview);
    }
    if (auto preview = optional_from_json<std::string>(j, "output_preview")) {
        span.set_output_preview(*preview);
    }
    return span;
}

nlohmann::json trace_to_json(const Trace& trace) {
    nlohmann::json spans = nlohmann::json::array();
    for (const auto& span : trace.spans) {
        spans.push_back(span_to_json(span));
    }

    nlohmann::json obj;
    obj["run_id"] = trace.run_id;
    obj["spans"] = std::move(spans);
    obj["budget_summary"] = trace.budget_summary;
    obj["start_time"] = format_iso8601(trace.start_time);
    obj["end_time"] = trace.end_time ? nlohmann::json(format_iso8601(*trace.end_time)) : nlohmann::json(nullptr);
    obj["total_cost"] = trace.total_cost();
    obj["total_input_tokens"] = trace.total_input_tokens();
    obj["total_output_tokens"] = trace.total_output_tokens();
    return obj;
}

Trace trace_from_json(const nlohmann::json& j) {
    Trace trace;
    trace.run_id = j.at("run_id").get<std::string>();
    for (const auto& span : j.at("spans")) {
        trace.spans.push_back(span_from_json(span));
    }
    if (j.contains("budget_summary") && !j["budget_summary"].is_null()) {
        trace.budget_summary = j["budget_summary"];
    }
    trace.start_time = parse_iso8601(j.at("start_time").get<std::string>());
    if (j.contains("end_time") && j["end_time"].is_string()) {
        trace.end_time = parse_iso8601(j["end_time"].get<std::string>());
    }
    return trace;
}

void TraceCollector::start_trace(const std::string& run_id, nlohmann::json budget_summary) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_.has_value()) {
        throw TetherError("A trace is already active for run " + current_->run_id);
    }
    Trace trace;
    trace.run_id = run_id;
    trace.budget_summary = budget_summary.is_null() ? nlohmann::json::object() : std::move(budget_summary);
    current_ = std::move(trace);
}

void TraceCollector::add_span(Span span) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (current_.has_value()) {
        current_->add_span(std::move(span));
    }
}

bool TraceCollector::update_span(const std::string& span_id, const std::function<void(Span&)>& update) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_.has_value()) {
        return false;
    }
    // recent spans are the likely targets
    for (auto it = current_->spans.rbegin(); it != current_->spans.rend(); ++it) {
        if (it->span_id == span_id) {
            update(*it);
            return true;
        }
    }
    return false;
}

std::optional<Trace> TraceCollector::end_trace() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!current_.has_value()) {
        return std::nullopt;
    }
    current_->end_time = std::chrono::system_clock::now();
    std::optional<Trace> trace = std::move(current_);
    current_.reset();
    return trace;
}

bool TraceCollector::has_active_trace() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_.has_value();
}

std::optional<Trace> TraceCollector::current_trace() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

} // namespace tether
