// tests/test_exporter.cpp
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "tether/common/utils.h"
#include "tether/trace/trace_exporter.h"
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace tether;
using Catch::Matchers::WithinAbs;

namespace {

Trace sample_trace(const std::string& run_id) {
    Trace trace;
    trace.run_id = run_id;

    Span ok;
    ok.run_id = run_id;
    ok.span_type = "llm_call";
    ok.model = "gpt-4o";
    ok.input_tokens = 1000;
    ok.output_tokens = 500;
    ok.cost_usd = 0.0075;
    trace.add_span(ok);

    Span failed;
    failed.run_id = run_id;
    failed.span_type = "llm_call";
    failed.model = "claude-3-haiku";
    failed.input_tokens = 20;
    failed.status = SpanStatus::ERROR;
    trace.add_span(failed);

    trace.end_time = std::chrono::system_clock::now();
    return trace;
}

} // namespace

TEST_CASE("Console exporter prints a per-span summary", "[exporter]") {
    std::ostringstream out;
    ConsoleExporter exporter(out);
    exporter.export_trace(sample_trace("run-console1"));

    std::string text = out.str();
    REQUIRE(text.find("=== Tether Trace: run-console1 ===") != std::string::npos);
    REQUIRE(text.find("Total Cost: $0.0075") != std::string::npos);
    REQUIRE(text.find("Input Tokens: 1020") != std::string::npos);
    REQUIRE(text.find("Output Tokens: 500") != std::string::npos);
    REQUIRE(text.find("Spans: 2") != std::string::npos);
    REQUIRE(text.find("[1] llm_call: gpt-4o (ok)") != std::string::npos);
    REQUIRE(text.find("Cost: $0.007500") != std::string::npos);
    REQUIRE(text.find("Input: 1000 tokens") != std::string::npos);
    REQUIRE(text.find("[2] llm_call: claude-3-haiku (error)") != std::string::npos);
}

TEST_CASE("Console exporter renders an empty trace", "[exporter]") {
    std::ostringstream out;
    ConsoleExporter exporter(out);
    Trace trace;
    trace.run_id = "run-empty000";
    std::string text = exporter.render(trace);
    REQUIRE(text.find("Spans: 0") != std::string::npos);
    REQUIRE(text.find("[1]") == std::string::npos);
    REQUIRE(out.str().empty());
}

TEST_CASE("JSON exporter writes one file per run", "[exporter]") {
    auto dir = std::filesystem::temp_directory_path() / ("tether_traces_" + generate_hex_id(8)) / "nested";
    JsonFileExporter exporter(dir);
    Trace trace = sample_trace("run-json0001");

    exporter.export_trace(trace);

    auto path = exporter.path_for(trace);
    REQUIRE(path == dir / "run-json0001.json");
    REQUIRE(std::filesystem::exists(path));

    std::ifstream file(path);
    nlohmann::json written = nlohmann::json::parse(file);
    REQUIRE(written["run_id"] == "run-json0001");
    REQUIRE(written["spans"].size() == 2);
    REQUIRE_THAT(written["total_cost"].get<double>(), WithinAbs(0.0075, 1e-12));
    REQUIRE(written["end_time"].is_string());

    Trace restored = trace_from_json(written);
    REQUIRE(restored.total_input_tokens() == 1020);

    std::filesystem::remove_all(dir.parent_path());
}

TEST_CASE("Exporter factory", "[exporter]") {
    REQUIRE(dynamic_cast<ConsoleExporter*>(make_exporter("console").get()) != nullptr);
    REQUIRE(dynamic_cast<JsonFileExporter*>(make_exporter("json", "/tmp/traces").get()) != nullptr);
    REQUIRE(dynamic_cast<NoopExporter*>(make_exporter("none").get()) != nullptr);
    REQUIRE(dynamic_cast<NoopExporter*>(make_exporter("noop").get()) != nullptr);
    REQUIRE(dynamic_cast<NoopExporter*>(make_exporter(TraceExportKind::NONE).get()) != nullptr);
    REQUIRE_THROWS_AS(make_exporter("otlp"), std::invalid_argument);

    REQUIRE_NOTHROW(make_exporter("none")->export_trace(sample_trace("run-noop0000")));
}
