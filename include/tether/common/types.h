// include/tether/common/types.h
#ifndef TETHER_COMMON_TYPES_H
#define TETHER_COMMON_TYPES_H

#include <nlohmann/json.hpp>
#include <functional>
#include <future>
#include <string>

namespace tether {

using ModelId = std::string; // e.g. "gpt-4o", "claude-3-haiku"

// One outbound metered call as seen at the interception boundary.
// `messages` is a chat array: [{"role": "...", "content": "..."}]
struct CallRequest {
    ModelId model = "unknown";
    nlohmann::json messages = nlohmann::json::array();
    nlohmann::json params = nlohmann::json::object(); // temperature, max_tokens, ...
};

// Responses follow the OpenAI chat-completion shape:
// {"choices": [{"message": {"content": "..."}}], "usage": {"prompt_tokens": N, "completion_tokens": M}}
using CompletionFn = std::function<nlohmann::json(const CallRequest&)>;
using AsyncCompletionFn = std::function<std::future<nlohmann::json>(const CallRequest&)>;

} // namespace tether

#endif // TETHER_COMMON_TYPES_H
