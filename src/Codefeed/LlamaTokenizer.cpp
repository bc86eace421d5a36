// =================================================================
// src/Codefeed/LlamaTokenizer.cpp
// =================================================================
// Implementation for llama.cpp-backed token counting.

#include "Codefeed/LlamaTokenizer.hpp"
#include "Codefeed/Errors.hpp"
#include "Codefeed/Logger.hpp"
#include "llama.h"
#include <limits>
#include <vector>

namespace Codefeed {

LlamaTokenizer::LlamaTokenizer(const std::string& model_path) : m_model_path(model_path) {
    llama_backend_init();

    auto mparams = llama_model_default_params();
    mparams.vocab_only = true;

    m_model = llama_load_model_from_file(model_path.c_str(), mparams);
    if (m_model == nullptr) {
        llama_backend_free();
        throw TokenizerError("Failed to load tokenizer vocabulary from: " + model_path);
    }

    Logger::getInstance().info("LlamaTokenizer", "Loaded vocabulary", model_path);
}

LlamaTokenizer::~LlamaTokenizer() {
    if (m_model) llama_free_model(m_model);
    llama_backend_free();
}

size_t LlamaTokenizer::countTokens(const std::string& text) const {
    if (text.empty()) {
        return 0;
    }
    if (text.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw TokenizerError("Text too large to tokenize in one pass");
    }

    const auto text_len = static_cast<int32_t>(text.size());

    // Start from a typical ratio; a negative result reports the exact size needed.
    std::vector<llama_token> tokens(text.size() / 2 + 16);
    int32_t n_tokens = llama_tokenize(m_model, text.c_str(), text_len,
                                      tokens.data(), static_cast<int32_t>(tokens.size()),
                                      false, false);
    if (n_tokens < 0) {
        tokens.resize(static_cast<size_t>(-n_tokens));
        n_tokens = llama_tokenize(m_model, text.c_str(), text_len,
                                  tokens.data(), static_cast<int32_t>(tokens.size()),
                                  false, false);
    }
    if (n_tokens < 0) {
        throw TokenizerError("Failed to tokenize text.");
    }

    return static_cast<size_t>(n_tokens);
}

std::string LlamaTokenizer::name() const {
    return "llama.cpp vocabulary (" + m_model_path + ")";
}

} // namespace Codefeed
