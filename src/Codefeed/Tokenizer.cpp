// =================================================================
// src/Codefeed/Tokenizer.cpp
// =================================================================
// Implementation for the built-in token estimator.

#include "Codefeed/Tokenizer.hpp"

namespace Codefeed {

size_t HeuristicTokenizer::countTokens(const std::string& text) const {
    // Round up so any non-empty text counts as at least one token
    return (text.size() + kBytesPerToken - 1) / kBytesPerToken;
}

std::string HeuristicTokenizer::name() const {
    return "heuristic (~" + std::to_string(kBytesPerToken) + " bytes/token)";
}

} // namespace Codefeed
