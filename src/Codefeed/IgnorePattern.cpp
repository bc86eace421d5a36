// =================================================================
// src/Codefeed/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-compatible pattern matching.

#include "Codefeed/IgnorePattern.hpp"
#include "Codefeed/Logger.hpp"
#include <fstream>
#include <utility>

namespace Codefeed {

namespace {

bool isRegexSpecial(char c) {
    switch (c) {
        case '.': case '^': case '$': case '+': case '{': case '}':
        case '|': case '(': case ')': case '[': case ']': case '\\':
        case '*': case '?':
            return true;
        default:
            return false;
    }
}

std::string escapeLiteral(char c) {
    std::string out;
    if (isRegexSpecial(c)) {
        out += '\\';
    }
    out += c;
    return out;
}

} // namespace

IgnorePattern::IgnorePattern(const std::string& pattern)
    : m_original_pattern(pattern),
      m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

bool IgnorePattern::matches(const std::string& path, bool is_directory) const {
    if (m_is_empty) {
        return false;
    }

    // Directory-only patterns only match directories
    if (m_directory_only && !is_directory) {
        return false;
    }

    if (m_is_anchored) {
        return std::regex_match(path, m_regex);
    }

    // Unanchored patterns match the final path component at any depth
    size_t slash = path.find_last_of('/');
    if (slash == std::string::npos) {
        return std::regex_match(path, m_regex);
    }
    return std::regex_match(path.begin() + static_cast<std::ptrdiff_t>(slash + 1), path.end(), m_regex);
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working_pattern = pattern;

    if (!working_pattern.empty() && working_pattern.back() == '\r') {
        working_pattern.pop_back();
    }

    // Skip empty lines and comments
    if (working_pattern.empty() || working_pattern[0] == '#') {
        m_is_empty = true;
        return;
    }

    // Trailing whitespace is dropped unless escaped with a backslash
    while (!working_pattern.empty() &&
           (working_pattern.back() == ' ' || working_pattern.back() == '\t')) {
        size_t len = working_pattern.size();
        if (len >= 2 && working_pattern[len - 2] == '\\') {
            break;
        }
        working_pattern.pop_back();
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    // Handle negation patterns and escaped leading characters
    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern = working_pattern.substr(1);
    } else if (working_pattern.size() >= 2 && working_pattern[0] == '\\' &&
               (working_pattern[1] == '!' || working_pattern[1] == '#')) {
        working_pattern = working_pattern.substr(1);
    }

    // Handle directory-only patterns
    if (!working_pattern.empty() && working_pattern.back() == '/') {
        m_directory_only = true;
        working_pattern.pop_back();
    }

    // A separator at the start or in the middle anchors the pattern
    if (working_pattern.find('/') != std::string::npos) {
        m_is_anchored = true;
        if (working_pattern[0] == '/') {
            working_pattern = working_pattern.substr(1);
        }
    }

    if (working_pattern.empty()) {
        m_is_empty = true;
        return;
    }

    try {
        m_regex = std::regex(globToRegex(working_pattern), std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        LOG_WARNING("IgnorePattern", "Failed to compile pattern '" + pattern + "': " + e.what());
        m_is_empty = true;
    }
}

std::string IgnorePattern::globToRegex(const std::string& glob_pattern) const {
    std::string regex_pattern = "^";
    const size_t len = glob_pattern.length();

    for (size_t i = 0; i < len; ++i) {
        char c = glob_pattern[i];

        switch (c) {
            case '*': {
                if (i + 1 < len && glob_pattern[i + 1] == '*') {
                    bool at_segment_start = (i == 0 || glob_pattern[i - 1] == '/');
                    size_t after = i + 2;
                    if (at_segment_start && after == len) {
                        // Trailing ** matches everything below
                        regex_pattern += ".*";
                        i += 1;
                    } else if (at_segment_start && glob_pattern[after] == '/') {
                        // **/ matches zero or more directories
                        regex_pattern += "(?:.*/)?";
                        i += 2;
                    } else {
                        // Any other ** behaves like a single *
                        regex_pattern += "[^/]*";
                        i += 1;
                    }
                } else {
                    // * matches anything except /
                    regex_pattern += "[^/]*";
                }
                break;
            }

            case '?':
                // ? matches any single character except /
                regex_pattern += "[^/]";
                break;

            case '[': {
                size_t j = i + 1;
                bool negated = false;
                if (j < len && (glob_pattern[j] == '!' || glob_pattern[j] == '^')) {
                    negated = true;
                    ++j;
                }
                size_t body_start = j;
                if (j < len && glob_pattern[j] == ']') {
                    ++j;
                }
                while (j < len && glob_pattern[j] != ']') {
                    if (glob_pattern[j] == '\\' && j + 1 < len) {
                        ++j;
                    }
                    ++j;
                }
                if (j >= len) {
                    // Unterminated class is a literal '['
                    regex_pattern += "\\[";
                    break;
                }

                regex_pattern += negated ? "[^/" : "[";
                for (size_t k = body_start; k < j; ++k) {
                    char ch = glob_pattern[k];
                    if (ch == '\\' && k + 1 < j) {
                        ch = glob_pattern[++k];
                        if (ch == ']' || ch == '[' || ch == '^' || ch == '\\' || ch == '-') {
                            regex_pattern += '\\';
                        }
                        regex_pattern += ch;
                    } else if (ch == ']' || ch == '[' || ch == '^' || ch == '\\') {
                        regex_pattern += '\\';
                        regex_pattern += ch;
                    } else {
                        regex_pattern += ch;
                    }
                }
                regex_pattern += ']';
                i = j;
                break;
            }

            case '\\':
                // Escape the next character
                if (i + 1 < len) {
                    regex_pattern += escapeLiteral(glob_pattern[++i]);
                } else {
                    regex_pattern += "\\\\";
                }
                break;

            default:
                regex_pattern += escapeLiteral(c);
                break;
        }
    }

    regex_pattern += "$";
    return regex_pattern;
}

// IgnorePatternSet implementation

IgnorePatternSet::IgnorePatternSet(std::filesystem::path base_dir)
    : m_base_dir(std::move(base_dir))
{
}

void IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (!ignore_pattern.isEmpty()) {
        m_patterns.push_back(std::move(ignore_pattern));
    }
}

size_t IgnorePatternSet::loadFromFile(const std::filesystem::path& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return 0;
    }

    size_t patterns_loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        IgnorePattern pattern(line);
        if (!pattern.isEmpty()) {
            m_patterns.push_back(std::move(pattern));
            patterns_loaded++;
        }
    }

    return patterns_loaded;
}

IgnoreMatch IgnorePatternSet::match(const std::filesystem::path& path, bool is_directory) const {
    std::filesystem::path relative = path.lexically_relative(m_base_dir);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        return IgnoreMatch::None;
    }
    return matchRelative(relative.generic_string(), is_directory);
}

IgnoreMatch IgnorePatternSet::matchRelative(const std::string& relative_path, bool is_directory) const {
    // Process patterns from the end - the last matching pattern wins
    for (auto it = m_patterns.rbegin(); it != m_patterns.rend(); ++it) {
        if (it->matches(relative_path, is_directory)) {
            return it->isNegation() ? IgnoreMatch::Whitelist : IgnoreMatch::Ignore;
        }
    }
    return IgnoreMatch::None;
}

bool IgnorePatternSet::shouldIgnore(const std::string& path, bool is_directory) const {
    return matchRelative(path, is_directory) == IgnoreMatch::Ignore;
}

} // namespace Codefeed
