// include/tether/common/logging.h
#ifndef TETHER_COMMON_LOGGING_H
#define TETHER_COMMON_LOGGING_H

#include <cstdint>
#include <string>

namespace tether {

enum class LogLevel : uint8_t {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Process-wide threshold; lines below it are dropped. Default: WARNING.
void set_log_level(LogLevel level);
LogLevel log_level();

// Accepts "debug", "info", "warning"/"warn", "error" (any case)
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// Writes "[LEVEL] message" to std::cerr
void log(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log(LogLevel::DEBUG, message); }
inline void log_info(const std::string& message) { log(LogLevel::INFO, message); }
inline void log_warning(const std::string& message) { log(LogLevel::WARNING, message); }
inline void log_error(const std::string& message) { log(LogLevel::ERROR, message); }

} // namespace tether

#endif // TETHER_COMMON_LOGGING_H
