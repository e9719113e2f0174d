// src/trace/trace_exporter.cpp
#include "tether/trace/trace_exporter.h"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace tether {

namespace {

constexpr const char* kConsoleTemplate = R"(=== Tether Trace: {{ run_id }} ===
Total Cost: ${{ total_cost }}
Input Tokens: {{ total_input_tokens }}
Output Tokens: {{ total_output_tokens }}
Spans: {{ span_count }}

## for span in spans
  [{{ loop.index1 }}] {{ span.span_type }}: {{ span.model }} ({{ span.status }})
## if span.has_cost
      Cost: ${{ span.cost }}
## endif
## if span.input_tokens > 0
      Input: {{ span.input_tokens }} tokens
## endif
## if span.output_tokens > 0
      Output: {{ span.output_tokens }} tokens
## endif

## endfor
)";

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

nlohmann::json console_view(const Trace& trace) {
    nlohmann::json spans = nlohmann::json::array();
    for (const auto& span : trace.spans) {
        spans.push_back({
            {"span_type", span.span_type},
            {"model", span.model.value_or("N/A")},
            {"status", to_string(span.status)},
            {"has_cost", span.cost_usd.has_value()},
            {"cost", format_fixed(span.cost_usd.value_or(0.0), 6)},
            {"input_tokens", span.input_tokens.value_or(0)},
            {"output_tokens", span.output_tokens.value_or(0)},
        });
    }

    nlohmann::json view;
    view["run_id"] = trace.run_id;
    view["total_cost"] = format_fixed(trace.total_cost(), 4);
    view["total_input_tokens"] = trace.total_input_tokens();
    view["total_output_tokens"] = trace.total_output_tokens();
    view["span_count"] = trace.spans.size();
    view["spans"] = std::move(spans);
    return view;
}

} // namespace

ConsoleExporter::ConsoleExporter(std::ostream& out) : out_(out) {
    env_.set_line_statement("##");
    env_.set_include_callback([](const std::filesystem::path&, const std::string&) -> inja::Template {
        throw inja::InjaError("render_error", "Include is disabled.", inja::SourceLocation{});
    });
    template_ = env_.parse(kConsoleTemplate);
}

std::string ConsoleExporter::render(const Trace& trace) {
    try {
        return env_.render(template_, console_view(trace));
    } catch (const inja::InjaError& e) {
        throw std::runtime_error("Trace render error: " + e.message);
    }
}

void ConsoleExporter::export_trace(const Trace& trace) {
    out_ << render(trace) << std::flush;
}

JsonFileExporter::JsonFileExporter(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {}

std::filesystem::path JsonFileExporter::path_for(const Trace& trace) const {
    return output_dir_ / (trace.run_id + ".json");
}

void JsonFileExporter::export_trace(const Trace& trace) {
    std::error_code ec;
    std::filesystem::create_directories(output_dir_, ec);
    if (ec) {
        throw std::runtime_error("Cannot create trace directory " + output_dir_.string() + ": " + ec.message());
    }

    auto path = path_for(trace);
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open trace file: " + path.string());
    }
    file << trace_to_json(trace).dump(2);
}

std::unique_ptr<TraceExporter> make_exporter(TraceExportKind kind, const std::string& output_dir) {
    switch (kind) {
        case TraceExportKind::CONSOLE: return std::make_unique<ConsoleExporter>();
        case TraceExportKind::JSON: return std::make_unique<JsonFileExporter>(output_dir);
        case TraceExportKind::NONE: return std::make_unique<NoopExporter>();
    }
    throw std::invalid_argument("Unknown exporter type");
}

std::unique_ptr<TraceExporter> make_exporter(const std::string& kind, const std::string& output_dir) {
    if (kind == "console") return make_exporter(TraceExportKind::CONSOLE, output_dir);
    if (kind == "json") return make_exporter(TraceExportKind::JSON, output_dir);
    if (kind == "none" || kind == "noop") return make_exporter(TraceExportKind::NONE, output_dir);
    throw std::invalid_argument("Unknown exporter type: " + kind);
}

} // namespace tether
