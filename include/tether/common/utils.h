// include/tether/common/utils.h
#ifndef TETHER_COMMON_UTILS_H
#define TETHER_COMMON_UTILS_H

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace tether {

// Lowercase and strip surrounding whitespace
std::string normalize_name(std::string_view name);

// Random lowercase hex string of `length` digits
std::string generate_hex_id(std::size_t length);

// "run-" + 8 hex digits
inline std::string generate_run_id() { return "run-" + generate_hex_id(8); }

// ISO-8601 UTC with microseconds: 2024-05-01T12:30:45.123456Z
std::string format_iso8601(std::chrono::system_clock::time_point tp);
// Accepts the format above; fractional part and trailing 'Z' optional
std::chrono::system_clock::time_point parse_iso8601(const std::string& text);

// Number of UTF-8 code points (continuation bytes are not counted)
std::size_t utf8_length(const std::string& text);

// First `max_chars` code points of `text`
std::string utf8_prefix(const std::string& text, std::size_t max_chars);

// Non-empty environment variable value
std::optional<std::string> get_env(const char* name);

} // namespace tether

#endif // TETHER_COMMON_UTILS_H
