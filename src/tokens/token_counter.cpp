// src/tokens/token_counter.cpp
#include "tether/tokens/token_counter.h"
#include "tether/tokens/llama_tokenizer.h"
#include "tether/common/errors.h"
#include "tether/common/logging.h"
#include "tether/common/utils.h"
#include <cctype>
#include <filesystem>

namespace tether {

namespace {

constexpr int kConversationOverhead = 3;
constexpr size_t kMaxSpecialTokenLength = 32;

struct RoleFrame {
    const char* prefix;
    const char* suffix;
};

RoleFrame frame_for_role(const std::string& role) {
    if (role == "system") return {"<|im_start|>system\n", "<|im_end|>\n"};
    if (role == "assistant") return {"<|im_start|>assistant\n", "<|im_end|>\n"};
    if (role == "tool") return {"<|im_start|>tool\n", "<|im_end|>\n"};
    return {"<|im_start|>user\n", "<|im_end|>\n"};
}

bool is_word_byte(unsigned char c) {
    return std::isalpha(c) || c >= 0x80;
}

bool is_digit_byte(unsigned char c) {
    return std::isdigit(c) != 0;
}

bool is_space_byte(unsigned char c) {
    return std::isspace(c) != 0;
}

// Single-vendor vocabularies only approximate these families
bool is_foreign_family(const std::string& model) {
    return model.rfind("claude-", 0) == 0 || model.rfind("gemini-", 0) == 0;
}

std::string message_text(const nlohmann::json& content) {
    if (content.is_string()) return content.get<std::string>();
    if (content.is_null()) return "";
    return content.dump();
}

} // namespace

int LocalTokenizer::count(const std::string& text, const std::string&) const {
    const size_t n = text.size();
    int tokens = 0;
    size_t i = 0;

    while (i < n) {
        unsigned char c = static_cast<unsigned char>(text[i]);

        if (c == '<' && i + 1 < n && text[i + 1] == '|') {
            size_t close = text.find("|>", i + 2);
            if (close != std::string::npos && close - i <= kMaxSpecialTokenLength) {
                tokens += 1;
                i = close + 2;
                continue;
            }
        }

        size_t j = i;
        if (is_word_byte(c)) {
            while (j < n && is_word_byte(static_cast<unsigned char>(text[j]))) ++j;
            tokens += static_cast<int>((j - i + 3) / 4);
        } else if (is_digit_byte(c)) {
            while (j < n && is_digit_byte(static_cast<unsigned char>(text[j]))) ++j;
            tokens += static_cast<int>((j - i + 2) / 3);
        } else if (is_space_byte(c)) {
            while (j < n && is_space_byte(static_cast<unsigned char>(text[j]))) ++j;
            size_t run = j - i;
            bool folds = text[j - 1] == ' ' && j < n &&
                         (is_word_byte(static_cast<unsigned char>(text[j])) ||
                          is_digit_byte(static_cast<unsigned char>(text[j])));
            if (folds) --run;
            if (run > 0) tokens += 1;
        } else {
            while (j < n) {
                unsigned char d = static_cast<unsigned char>(text[j]);
                if (is_word_byte(d) || is_digit_byte(d) || is_space_byte(d)) break;
                if (j > i && d == '<' && j + 1 < n && text[j + 1] == '|') break;
                ++j;
            }
            tokens += static_cast<int>((j - i + 1) / 2);
        }
        i = j;
    }
    return tokens;
}

TokenCounter::TokenCounter(TokenCounterBackend backend, std::string vocab_path)
    : local_(std::make_shared<LocalTokenizer>()) {
    if (vocab_path.empty()) {
        vocab_path = get_env("TETHER_TOKENIZER_VOCAB").value_or("");
    }

    if (backend == TokenCounterBackend::LOCAL) {
        backend_ = local_;
        resolved_ = TokenCounterBackend::LOCAL;
        return;
    }

    if (backend == TokenCounterBackend::EXTERNAL) {
        if (vocab_path.empty()) {
            throw TokenCountError("External token counter requires a tokenizer vocabulary (TETHER_TOKENIZER_VOCAB)");
        }
        backend_ = std::make_shared<LlamaVocabTokenizer>(vocab_path);
        resolved_ = TokenCounterBackend::EXTERNAL;
        fallback_to_local_ = true;
        return;
    }

    // AUTO: use a vocabulary when one is present, otherwise stay local
    std::error_code ec;
    if (!vocab_path.empty() && std::filesystem::exists(vocab_path, ec)) {
        try {
            backend_ = std::make_shared<LlamaVocabTokenizer>(vocab_path);
            resolved_ = TokenCounterBackend::EXTERNAL;
            fallback_to_local_ = true;
            return;
        } catch (const TokenCountError& e) {
            log_warning(std::string(e.what()) + ", using local tokenizer");
        }
    }
    backend_ = local_;
    resolved_ = TokenCounterBackend::LOCAL;
}

TokenCounter::TokenCounter(std::shared_ptr<const TokenizerBackend> backend, bool fallback_to_local)
    : backend_(std::move(backend)),
      local_(std::make_shared<LocalTokenizer>()),
      resolved_(TokenCounterBackend::EXTERNAL),
      fallback_to_local_(fallback_to_local) {
    if (!backend_) {
        throw std::invalid_argument("TokenCounter backend must not be null");
    }
}

void TokenCounter::note_vendor_caveat(const std::string& model) {
    if (backend_->vendor_neutral() || !is_foreign_family(model)) {
        return;
    }
    std::string message = "Using " + backend_->name() + " tokenizer for model " + model +
                          ". Token counts may be inaccurate (up to 12% error).";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!warned_models_.insert(model).second) {
            return;
        }
        warnings_.push_back(message);
    }
    log_warning(message);
}

int TokenCounter::count_with_backend(const std::string& text, const std::string& model) {
    try {
        return backend_->count(text, model);
    } catch (const std::exception& e) {
        if (!fallback_to_local_) {
            if (dynamic_cast<const TokenCountError*>(&e)) throw;
            throw TokenCountError(std::string("Token counting failed: ") + e.what(), model);
        }
        log_warning(backend_->name() + " token counter failed for " + model + " (" + e.what() +
                    "), falling back to local tokenizer");
        return local_->count(text, model);
    }
}

int TokenCounter::count_tokens(const std::string& text, const std::string& model) {
    if (text.empty()) {
        return 0;
    }
    note_vendor_caveat(model);
    return count_with_backend(text, model);
}

int TokenCounter::count_messages(const nlohmann::json& messages, const std::string& model) {
    if (!messages.is_array()) {
        throw TokenCountError("Messages must be a JSON array", model);
    }
    if (messages.empty()) {
        return 0;
    }
    note_vendor_caveat(model);

    int total = 0;
    for (const auto& message : messages) {
        std::string role = "user";
        std::string content;
        if (message.is_object()) {
            if (message.contains("role") && message["role"].is_string()) {
                role = message["role"].get<std::string>();
            }
            if (message.contains("content")) {
                content = message_text(message["content"]);
            }
        } else {
            content = message_text(message);
        }

        RoleFrame frame = frame_for_role(role);
        total += count_with_backend(frame.prefix + content + frame.suffix, model);
    }
    return total + kConversationOverhead;
}

std::vector<std::string> TokenCounter::warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

int count_tokens(const std::string& text, const std::string& model, TokenCounterBackend backend) {
    TokenCounter counter(backend);
    return counter.count_tokens(text, model);
}

int count_messages(const nlohmann::json& messages, const std::string& model, TokenCounterBackend backend) {
    TokenCounter counter(backend);
    return counter.count_messages(messages, model);
}

} // namespace tether
