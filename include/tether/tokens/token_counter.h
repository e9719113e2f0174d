// include/tether/tokens/token_counter.h
#ifndef TETHER_TOKENS_TOKEN_COUNTER_H
#define TETHER_TOKENS_TOKEN_COUNTER_H

#include "tether/config/config.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace tether {

// A tokenizer: a pure function of (text, model).
class TokenizerBackend {
public:
    virtual ~TokenizerBackend() = default;

    virtual std::string name() const = 0;

    // Throws TokenCountError on failure
    virtual int count(const std::string& text, const std::string& model) const = 0;

    // False when the vocabulary belongs to one vendor, so counts for other
    // model families are approximations
    virtual bool vendor_neutral() const { return false; }
};

// Approximate BPE-style counter modelled on cl100k pre-tokenization:
// letters ~4 bytes/token, digits in groups of 3, a single space folds into
// the following word, <|special|> markers count as one token.
class LocalTokenizer : public TokenizerBackend {
public:
    std::string name() const override { return "local"; }
    int count(const std::string& text, const std::string& model) const override;
};

class TokenCounter {
public:
    // AUTO picks EXTERNAL when `vocab_path` (or TETHER_TOKENIZER_VOCAB) names
    // an existing GGUF file, LOCAL otherwise. EXTERNAL without a usable
    // vocabulary throws TokenCountError.
    explicit TokenCounter(TokenCounterBackend backend = TokenCounterBackend::AUTO, std::string vocab_path = {});

    // Custom backend. With fallback_to_local, backend failures are logged and
    // answered by the local tokenizer instead of throwing.
    explicit TokenCounter(std::shared_ptr<const TokenizerBackend> backend, bool fallback_to_local = false);

    // 0 for empty text
    int count_tokens(const std::string& text, const std::string& model = "gpt-4o");

    // [{"role": "...", "content": "..."}]; 0 for an empty array. Each message
    // is counted inside its ChatML role frame, plus 3 per conversation.
    int count_messages(const nlohmann::json& messages, const std::string& model = "gpt-4o");

    TokenCounterBackend backend() const { return resolved_; }
    std::string backend_name() const { return backend_->name(); }

    // Approximation warnings recorded so far, one per model
    std::vector<std::string> warnings() const;

private:
    int count_with_backend(const std::string& text, const std::string& model);
    void note_vendor_caveat(const std::string& model);

    std::shared_ptr<const TokenizerBackend> backend_;
    std::shared_ptr<const TokenizerBackend> local_;
    TokenCounterBackend resolved_ = TokenCounterBackend::LOCAL;
    bool fallback_to_local_ = false;

    mutable std::mutex mutex_;
    std::set<std::string> warned_models_;
    std::vector<std::string> warnings_;
};

int count_tokens(const std::string& text, const std::string& model = "gpt-4o",
                 TokenCounterBackend backend = TokenCounterBackend::AUTO);
int count_messages(const nlohmann::json& messages, const std::string& model = "gpt-4o",
                   TokenCounterBackend backend = TokenCounterBackend::AUTO);

} // namespace tether

#endif // TETHER_TOKENS_TOKEN_COUNTER_H
