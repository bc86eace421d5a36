// =================================================================
// include/Codefeed/Tokenizer.hpp
// =================================================================
// Abstract interface for token counting, plus the built-in estimator.

#pragma once

#include <cstddef>
#include <string>

namespace Codefeed {

/**
 * @brief Pure text -> token count capability
 */
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    /**
     * @brief Count the tokens a model would see for this text
     * @param text UTF-8 text
     * @return Token count
     * @throws TokenizerError if the backend fails
     */
    virtual size_t countTokens(const std::string& text) const = 0;

    /**
     * @brief Short description of the backend, for logs
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Character-count estimate (about four bytes per token)
 *
 * Used when no model vocabulary is configured.
 */
class HeuristicTokenizer : public Tokenizer {
public:
    static constexpr size_t kBytesPerToken = 4;

    size_t countTokens(const std::string& text) const override;
    std::string name() const override;
};

} // namespace Codefeed
