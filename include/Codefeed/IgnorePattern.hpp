// =================================================================
// include/Codefeed/IgnorePattern.hpp
// =================================================================
// Header for gitignore-compatible pattern matching functionality.

#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <regex>

namespace Codefeed {

/**
 * @brief Gitignore-compatible pattern matching utility
 *
 * Supports the gitignore pattern syntax:
 * - Wildcards: *, ?, [...] and [!...]
 * - Double star: leading "**" + "/", trailing "/" + "**", inner "/" + "**" + "/"
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Anchoring: a slash at the start or in the middle ties the pattern to
 *   the directory holding the ignore file; otherwise it matches a name at
 *   any depth
 * - Comment lines (# comment), escaped leading \# and \!, trailing
 *   whitespace trimming unless escaped
 */
class IgnorePattern {
public:
    /**
     * @brief Construct a pattern matcher from a gitignore-style pattern
     * @param pattern The pattern string (one line of an ignore file)
     */
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check if a path matches this pattern
     * @param path Path relative to the ignore file's directory, '/'-separated
     * @param is_directory True if the path is a directory
     * @return true if path matches the pattern (negation is not applied here)
     */
    bool matches(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Check if this is a negation pattern (starts with !)
     */
    bool isNegation() const { return m_is_negation; }

    /**
     * @brief Check if this pattern only matches directories (ends with /)
     */
    bool isDirectoryOnly() const { return m_directory_only; }

    /**
     * @brief Check if this pattern is tied to the ignore file's directory
     */
    bool isAnchored() const { return m_is_anchored; }

    /**
     * @brief Get the original pattern string
     */
    const std::string& getPattern() const { return m_original_pattern; }

    /**
     * @brief Check if pattern is empty or comment
     * @return true if pattern should be ignored
     */
    bool isEmpty() const { return m_is_empty; }

private:
    std::string m_original_pattern;
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::regex m_regex;

    void processPattern(const std::string& pattern);

    /**
     * @brief Convert gitignore glob pattern to an anchored regex
     * @param glob_pattern Glob pattern string
     * @return Equivalent regex pattern
     */
    std::string globToRegex(const std::string& glob_pattern) const;
};

/**
 * @brief Outcome of matching a path against a pattern set
 */
enum class IgnoreMatch {
    None,       ///< No pattern matched
    Ignore,     ///< Last matching pattern excludes the path
    Whitelist   ///< Last matching pattern is a negation
};

/**
 * @brief The patterns of one ignore file, relative to the file's directory
 */
class IgnorePatternSet {
public:
    /**
     * @brief Construct an empty set
     * @param base_dir Directory the patterns are relative to
     */
    explicit IgnorePatternSet(std::filesystem::path base_dir = {});

    /**
     * @brief Add a pattern to the set
     * @param pattern Pattern string
     */
    void addPattern(const std::string& pattern);

    /**
     * @brief Load patterns from a file (e.g., .gitignore)
     * @param file_path Path to ignore file
     * @return Number of patterns loaded
     */
    size_t loadFromFile(const std::filesystem::path& file_path);

    /**
     * @brief Match an absolute path; later patterns override earlier ones
     * @param path Absolute path below the base directory
     * @param is_directory True if path is a directory
     */
    IgnoreMatch match(const std::filesystem::path& path, bool is_directory) const;

    /**
     * @brief Match a path already expressed relative to the base directory
     * @param relative_path '/'-separated relative path
     * @param is_directory True if path is a directory
     */
    IgnoreMatch matchRelative(const std::string& relative_path, bool is_directory) const;

    /**
     * @brief Check if a relative path should be ignored
     * @param path Path relative to the base directory
     * @param is_directory True if path is a directory
     * @return true if path should be ignored
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    const std::filesystem::path& baseDir() const { return m_base_dir; }

    size_t size() const { return m_patterns.size(); }
    bool empty() const { return m_patterns.empty(); }

    void clear() { m_patterns.clear(); }

private:
    std::filesystem::path m_base_dir;
    std::vector<IgnorePattern> m_patterns;
};

} // namespace Codefeed
