// include/tether/tokens/llama_tokenizer.h
#ifndef TETHER_TOKENS_LLAMA_TOKENIZER_H
#define TETHER_TOKENS_LLAMA_TOKENIZER_H

#include "tether/tokens/token_counter.h"
#include <memory>
#include <string>

struct llama_model;

namespace tether {

// Counts with a llama.cpp vocabulary loaded vocab_only from a GGUF file.
// Vocabularies are cached per path for the life of the process.
class LlamaVocabTokenizer : public TokenizerBackend {
public:
    // Throws TokenCountError when the file cannot be loaded
    explicit LlamaVocabTokenizer(const std::string& vocab_path);

    std::string name() const override { return "external"; }
    int count(const std::string& text, const std::string& model) const override;

    const std::string& vocab_path() const { return vocab_path_; }

private:
    struct Vocab;
    static std::shared_ptr<Vocab> load_cached(const std::string& path);

    std::string vocab_path_;
    std::shared_ptr<Vocab> vocab_;
};

} // namespace tether

#endif // TETHER_TOKENS_LLAMA_TOKENIZER_H
