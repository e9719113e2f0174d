// src/common/logging.cpp
#include "tether/common/logging.h"
#include "tether/common/utils.h"
#include <atomic>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace tether {

namespace {

std::atomic<LogLevel> g_log_level{LogLevel::WARNING};
std::mutex g_log_mutex; // keeps concurrent lines from interleaving

} // namespace

void set_log_level(LogLevel level) {
    g_log_level.store(level);
}

LogLevel log_level() {
    return g_log_level.load();
}

LogLevel parse_log_level(const std::string& name) {
    std::string normalized = normalize_name(name);
    if (normalized == "debug") return LogLevel::DEBUG;
    if (normalized == "info") return LogLevel::INFO;
    if (normalized == "warning" || normalized == "warn") return LogLevel::WARNING;
    if (normalized == "error") return LogLevel::ERROR;
    throw std::invalid_argument("Invalid log_level: " + name);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR: return "ERROR";
    }
    return "WARNING";
}

void log(LogLevel level, const std::string& message) {
    if (static_cast<uint8_t>(level) < static_cast<uint8_t>(g_log_level.load())) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[" << log_level_name(level) << "] " << message << std::endl;
}

} // namespace tether
