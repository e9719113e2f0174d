// src/tokens/llama_tokenizer.cpp
#include "tether/tokens/llama_tokenizer.h"
#include "tether/common/errors.h"
#include "tether/common/logging.h"
#include <llama.h>
#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace tether {

struct LlamaVocabTokenizer::Vocab {
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model{nullptr, llama_model_free};
    const llama_vocab* vocab = nullptr;
};

std::shared_ptr<LlamaVocabTokenizer::Vocab> LlamaVocabTokenizer::load_cached(const std::string& path) {
    static std::once_flag backend_once;
    static std::mutex cache_mutex;
    static std::unordered_map<std::string, std::shared_ptr<Vocab>> cache;

    std::call_once(backend_once, [] { llama_backend_init(); });

    std::lock_guard<std::mutex> lock(cache_mutex);
    auto it = cache.find(path);
    if (it != cache.end()) {
        return it->second;
    }

    llama_model_params params = llama_model_default_params();
    params.vocab_only = true;

    auto vocab = std::make_shared<Vocab>();
    llama_model* raw_model = llama_model_load_from_file(path.c_str(), params);
    if (!raw_model) {
        throw TokenCountError("Failed to load tokenizer vocabulary: " + path);
    }
    vocab->model.reset(raw_model);
    vocab->vocab = llama_model_get_vocab(raw_model);
    log_debug("Loaded tokenizer vocabulary " + path);

    cache.emplace(path, vocab);
    return vocab;
}

LlamaVocabTokenizer::LlamaVocabTokenizer(const std::string& vocab_path)
    : vocab_path_(vocab_path), vocab_(load_cached(vocab_path)) {}

int LlamaVocabTokenizer::count(const std::string& text, const std::string& model) const {
    if (text.empty()) {
        return 0;
    }
    // With no output buffer llama_tokenize returns the negated token count
    int32_t n = llama_tokenize(vocab_->vocab, text.data(), static_cast<int32_t>(text.size()), nullptr, 0,
                               /*add_special=*/false, /*parse_special=*/true);
    if (n == INT32_MIN) {
        throw TokenCountError("Tokenization overflow for model " + model, model);
    }
    return n < 0 ? -n : n;
}

} // namespace tether
