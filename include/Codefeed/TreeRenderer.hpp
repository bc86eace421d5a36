// =================================================================
// include/Codefeed/TreeRenderer.hpp
// =================================================================
// Incremental text rendering of the visited directory tree.

#pragma once

#include <cstddef>
#include <sstream>
#include <string>

namespace Codefeed {

/**
 * @brief How a file ended up, as far as the tree is concerned
 */
enum class FileOutcome {
    Included,   ///< Content admitted; plain line
    NonText     ///< Classified binary; annotated line
};

/**
 * @brief Builds the indented tree one entry at a time
 *
 * Lines look like:
 * @code
 * └── project
 * ├── src
 *     └── main.cpp
 *     └── logo.png [Non-text file]
 * @endcode
 * Indentation is four spaces per level below the first. Skipped files are
 * never passed in; they only appear in the skip report.
 */
class TreeRenderer {
public:
    static constexpr const char* kNonTextAnnotation = " [Non-text file]";

    /**
     * @brief Render the traversal root
     * @param name Final component of the root path
     * @return The rendered line (without newline)
     */
    std::string visitRoot(const std::string& name);

    /**
     * @brief Render a directory
     * @param name Directory name
     * @param depth Path segments below the root (>= 1)
     */
    std::string visitDirectory(const std::string& name, size_t depth);

    /**
     * @brief Render a file that was either included or classified non-text
     * @param name File name
     * @param depth Path segments below the root (>= 1)
     * @param outcome Included or NonText
     */
    std::string visitFile(const std::string& name, size_t depth, FileOutcome outcome);

    /**
     * @brief The accumulated tree with trailing whitespace trimmed
     */
    std::string str() const;

    size_t lineCount() const { return m_line_count; }

private:
    std::ostringstream m_tree;
    size_t m_line_count = 0;

    static std::string indent(size_t depth);
    std::string append(std::string line);
};

} // namespace Codefeed
