// =================================================================
// include/Codefeed/LlamaTokenizer.hpp
// =================================================================
// Token counting with the vocabulary of a GGUF model via llama.cpp.

#pragma once

#include "Codefeed/Tokenizer.hpp"
#include <string>

// Forward declare llama.cpp structs to keep the header clean
struct llama_model;

namespace Codefeed {

class LlamaTokenizer : public Tokenizer {
public:
    /**
     * @brief Load only the vocabulary of a model.
     * @param model_path Full path to the GGUF model file.
     * @throws TokenizerError if the model cannot be loaded.
     */
    explicit LlamaTokenizer(const std::string& model_path);

    ~LlamaTokenizer() override;

    // Disable copy and move semantics for this class as it manages raw pointers.
    LlamaTokenizer(const LlamaTokenizer&) = delete;
    LlamaTokenizer& operator=(const LlamaTokenizer&) = delete;
    LlamaTokenizer(LlamaTokenizer&&) = delete;
    LlamaTokenizer& operator=(LlamaTokenizer&&) = delete;

    size_t countTokens(const std::string& text) const override;
    std::string name() const override;

private:
    llama_model* m_model = nullptr;
    std::string m_model_path;
};

} // namespace Codefeed
