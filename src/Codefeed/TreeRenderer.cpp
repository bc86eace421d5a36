// =================================================================
// src/Codefeed/TreeRenderer.cpp
// =================================================================
// Implementation for tree rendering.

#include "Codefeed/TreeRenderer.hpp"
#include "Codefeed/FileReader.hpp"
#include <utility>

namespace Codefeed {

std::string TreeRenderer::visitRoot(const std::string& name) {
    return append("└── " + name);
}

std::string TreeRenderer::visitDirectory(const std::string& name, size_t depth) {
    return append(indent(depth) + "├── " + name);
}

std::string TreeRenderer::visitFile(const std::string& name, size_t depth, FileOutcome outcome) {
    std::string line = indent(depth) + "└── " + name;
    if (outcome == FileOutcome::NonText) {
        line += kNonTextAnnotation;
    }
    return append(std::move(line));
}

std::string TreeRenderer::str() const {
    return trimTrailingWhitespace(m_tree.str());
}

std::string TreeRenderer::indent(size_t depth) {
    if (depth <= 1) {
        return "";
    }
    std::string result;
    result.reserve((depth - 1) * 4);
    for (size_t i = 1; i < depth; ++i) {
        result += "    ";
    }
    return result;
}

std::string TreeRenderer::append(std::string line) {
    m_tree << line << '\n';
    m_line_count++;
    return line;
}

} // namespace Codefeed
