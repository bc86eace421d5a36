// =================================================================
// include/Codefeed/Errors.hpp
// =================================================================
// Exception types shared by the traversal pipeline.

#pragma once

#include <stdexcept>
#include <string>

namespace Codefeed {

/**
 * @brief A single file could not be inspected or read.
 *
 * Recoverable: the Aggregator turns it into a skip record and moves on.
 */
class FileAccessError : public std::runtime_error {
public:
    explicit FileAccessError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The traversal itself cannot continue (root unreadable, a path
 * outside the root, current directory unavailable). Fatal for the run.
 */
class TraversalError : public std::runtime_error {
public:
    explicit TraversalError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The tokenizer backend could not be initialized or failed to
 * tokenize. Fatal when a report was requested.
 */
class TokenizerError : public std::runtime_error {
public:
    explicit TokenizerError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace Codefeed
