// =================================================================
// include/Codefeed/DirectoryWalker.hpp
// =================================================================
// Ignore-aware depth-first traversal producing a lazy stream of entries.

#pragma once

#include "Codefeed/IgnorePattern.hpp"
#include <cstddef>
#include <filesystem>
#include <vector>

namespace Codefeed {

enum class EntryKind {
    Root,
    Directory,
    File
};

/**
 * @brief One filesystem entry yielded by a traversal
 */
struct Entry {
    std::filesystem::path path;  ///< Absolute path
    EntryKind kind = EntryKind::File;
    size_t depth = 0;            ///< Path segments below the root; 0 for the root
};

/**
 * @brief A finite, non-restartable sequence of entries
 *
 * The first entry is the root. Anything the source decided to ignore is
 * simply never produced.
 */
class EntrySource {
public:
    virtual ~EntrySource() = default;

    /**
     * @brief Produce the next entry
     * @param entry Filled in when an entry is available
     * @return false once the sequence is exhausted
     */
    virtual bool next(Entry& entry) = 0;
};

/**
 * @brief Walks a directory tree honoring ignore files
 *
 * Order is depth-first with each directory before its children and siblings
 * sorted by name. Hidden entries (leading '.') are skipped. `.ignore` files
 * always apply, including those of the root's ancestors; `.gitignore` files,
 * `.git/info/exclude` and the global git excludes file apply when the root
 * is inside a git work tree. Symbolic
 * links are never descended; a link to a regular file is yielded as a file.
 */
class DirectoryWalker : public EntrySource {
public:
    /**
     * @brief Prepare a walk rooted at the given directory
     * @param root_path Directory to walk; made absolute
     * @throws TraversalError if the root is not a readable directory
     */
    explicit DirectoryWalker(const std::filesystem::path& root_path);

    bool next(Entry& entry) override;

    const std::filesystem::path& rootPath() const { return m_root; }

    /**
     * @brief Top of the enclosing git work tree; empty when not in one
     */
    const std::filesystem::path& gitTopLevel() const { return m_git_top; }

    bool inGitRepository() const { return !m_git_top.empty(); }

private:
    struct Frame {
        std::vector<std::filesystem::directory_entry> children;
        size_t next_child = 0;
        size_t depth = 0;           ///< Depth of the directory this frame lists
        size_t rule_sets_pushed = 0;
    };

    std::filesystem::path m_root;
    std::filesystem::path m_git_top;
    bool m_started = false;

    std::vector<Frame> m_stack;
    std::vector<IgnorePatternSet> m_rules;  ///< Lowest precedence first

    void discoverGitTopLevel();
    void loadAncestorRules();
    bool isWithinRepository(const std::filesystem::path& dir) const;

    /**
     * @brief Load the ignore files of one directory onto the rule stack
     * @return Number of rule sets pushed
     */
    size_t pushDirectoryRules(const std::filesystem::path& dir);
    bool pushRuleFile(const std::filesystem::path& file, const std::filesystem::path& base_dir);

    /**
     * @brief List a directory and push a frame for it
     * @return false if the directory could not be read
     */
    bool enterDirectory(const std::filesystem::path& dir, size_t depth);
    void leaveDirectory();

    bool isIgnored(const std::filesystem::path& path, bool is_directory) const;

    /**
     * @brief Decide whether a child is yielded as a directory or a file
     * @return false for links to non-files, special files and dangling links
     */
    static bool classifyChild(const std::filesystem::directory_entry& child, EntryKind& kind);
};

} // namespace Codefeed
