// include/tether/trace/trace_exporter.h
#ifndef TETHER_TRACE_TRACE_EXPORTER_H
#define TETHER_TRACE_TRACE_EXPORTER_H

#include "tether/config/config.h"
#include "tether/trace/trace.h"
#include <inja/inja.hpp>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace tether {

class TraceExporter {
public:
    virtual ~TraceExporter() = default;
    virtual void export_trace(const Trace& trace) = 0;
};

// Human-readable per-span summary (model, cost, tokens)
class ConsoleExporter : public TraceExporter {
public:
    explicit ConsoleExporter(std::ostream& out = std::cerr);

    void export_trace(const Trace& trace) override;

    std::string render(const Trace& trace);

private:
    std::ostream& out_;
    inja::Environment env_;
    inja::Template template_;
};

// Writes <output_dir>/<run_id>.json, creating the directory if needed
class JsonFileExporter : public TraceExporter {
public:
    explicit JsonFileExporter(std::filesystem::path output_dir = "./traces/");

    void export_trace(const Trace& trace) override;

    std::filesystem::path path_for(const Trace& trace) const;

private:
    std::filesystem::path output_dir_;
};

class NoopExporter : public TraceExporter {
public:
    void export_trace(const Trace&) override {}
};

std::unique_ptr<TraceExporter> make_exporter(TraceExportKind kind, const std::string& output_dir = "./traces/");

// "console", "json", "none"/"noop"; anything else throws std::invalid_argument
std::unique_ptr<TraceExporter> make_exporter(const std::string& kind, const std::string& output_dir = "./traces/");

} // namespace tether

#endif // TETHER_TRACE_TRACE_EXPORTER_H
