// =================================================================
// src/Codefeed/DirectoryWalker.cpp
// =================================================================
// Implementation for the ignore-aware directory walker.

#include "Codefeed/DirectoryWalker.hpp"
#include "Codefeed/Errors.hpp"
#include "Codefeed/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace Codefeed {

DirectoryWalker::DirectoryWalker(const fs::path& root_path) {
    std::error_code ec;
    m_root = fs::absolute(root_path, ec).lexically_normal();
    if (ec) {
        throw TraversalError("Failed to resolve path: " + root_path.string() + ": " + ec.message());
    }
    if (!m_root.has_filename() && m_root.has_relative_path()) {
        m_root = m_root.parent_path();
    }

    if (!fs::is_directory(m_root, ec)) {
        throw TraversalError("Not a directory: " + m_root.string());
    }
    fs::directory_iterator listing(m_root, ec);
    if (ec) {
        throw TraversalError("Failed to read directory " + m_root.string() + ": " + ec.message());
    }

    discoverGitTopLevel();
    loadAncestorRules();
}

bool DirectoryWalker::next(Entry& entry) {
    if (!m_started) {
        m_started = true;
        if (!enterDirectory(m_root, 0)) {
            throw TraversalError("Failed to read directory " + m_root.string());
        }
        entry = Entry{m_root, EntryKind::Root, 0};
        return true;
    }

    while (!m_stack.empty()) {
        Frame& frame = m_stack.back();
        if (frame.next_child >= frame.children.size()) {
            leaveDirectory();
            continue;
        }

        // Copy: entering a subdirectory below may reallocate the stack
        const fs::directory_entry child = frame.children[frame.next_child++];
        const size_t depth = frame.depth + 1;

        const std::string name = child.path().filename().string();
        if (!name.empty() && name[0] == '.') {
            continue;
        }

        EntryKind kind;
        if (!classifyChild(child, kind)) {
            LOG_DEBUG("DirectoryWalker", "Skipping special file: " + child.path().string());
            continue;
        }

        const bool is_directory = (kind == EntryKind::Directory);
        if (isIgnored(child.path(), is_directory)) {
            LOG_DEBUG("DirectoryWalker", "Ignored: " + child.path().string());
            continue;
        }

        if (is_directory && !enterDirectory(child.path(), depth)) {
            LOG_WARNING("DirectoryWalker", "Cannot read directory, not descending: " + child.path().string());
        }

        entry = Entry{child.path(), kind, depth};
        return true;
    }

    return false;
}

void DirectoryWalker::discoverGitTopLevel() {
    std::error_code ec;
    for (fs::path dir = m_root; ; dir = dir.parent_path()) {
        if (fs::exists(dir / ".git", ec)) {
            m_git_top = dir;
            LOG_DEBUG("DirectoryWalker", "Inside git work tree: " + dir.string());
            return;
        }
        if (dir == dir.parent_path()) {
            return;
        }
    }
}

void DirectoryWalker::loadAncestorRules() {
    if (inGitRepository()) {
        // Global excludes, lowest precedence
        const char* xdg_config = std::getenv("XDG_CONFIG_HOME");
        const char* home = std::getenv("HOME");
        if (xdg_config != nullptr && *xdg_config != '\0') {
            pushRuleFile(fs::path(xdg_config) / "git" / "ignore", m_git_top);
        } else if (home != nullptr && *home != '\0') {
            pushRuleFile(fs::path(home) / ".config" / "git" / "ignore", m_git_top);
        }

        pushRuleFile(m_git_top / ".git" / "info" / "exclude", m_git_top);
    }

    // Ignore files of every ancestor of the root, outermost first. A
    // .gitignore only counts from the repository top downwards.
    std::vector<fs::path> ancestors;
    for (fs::path dir = m_root; dir != dir.parent_path(); ) {
        dir = dir.parent_path();
        ancestors.push_back(dir);
    }
    for (auto it = ancestors.rbegin(); it != ancestors.rend(); ++it) {
        if (inGitRepository() && isWithinRepository(*it)) {
            pushDirectoryRules(*it);
        } else {
            pushRuleFile(*it / ".ignore", *it);
        }
    }
}

bool DirectoryWalker::isWithinRepository(const fs::path& dir) const {
    fs::path relative = dir.lexically_relative(m_git_top);
    return !relative.empty() && *relative.begin() != "..";
}

size_t DirectoryWalker::pushDirectoryRules(const fs::path& dir) {
    size_t pushed = 0;
    if (inGitRepository() && pushRuleFile(dir / ".gitignore", dir)) {
        pushed++;
    }
    if (pushRuleFile(dir / ".ignore", dir)) {
        pushed++;
    }
    return pushed;
}

bool DirectoryWalker::pushRuleFile(const fs::path& file, const fs::path& base_dir) {
    IgnorePatternSet rules(base_dir);
    size_t loaded = rules.loadFromFile(file);
    if (loaded == 0) {
        return false;
    }

    LOG_DEBUG("DirectoryWalker", "Loaded " + std::to_string(loaded) + " patterns from " + file.string());
    m_rules.push_back(std::move(rules));
    return true;
}

bool DirectoryWalker::enterDirectory(const fs::path& dir, size_t depth) {
    std::error_code ec;
    std::vector<fs::directory_entry> children;

    for (fs::directory_iterator it(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) {
        children.push_back(*it);
    }
    if (ec) {
        LOG_DEBUG("DirectoryWalker", "Listing failed for " + dir.string() + ": " + ec.message());
        return false;
    }

    std::sort(children.begin(), children.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename().string() < b.path().filename().string();
              });

    Frame frame;
    frame.children = std::move(children);
    frame.depth = depth;
    frame.rule_sets_pushed = pushDirectoryRules(dir);
    m_stack.push_back(std::move(frame));
    return true;
}

void DirectoryWalker::leaveDirectory() {
    size_t to_pop = m_stack.back().rule_sets_pushed;
    m_rules.erase(m_rules.end() - static_cast<std::ptrdiff_t>(to_pop), m_rules.end());
    m_stack.pop_back();
}

bool DirectoryWalker::isIgnored(const fs::path& path, bool is_directory) const {
    // Deepest, most specific rules first; the first set with an opinion decides
    for (auto it = m_rules.rbegin(); it != m_rules.rend(); ++it) {
        IgnoreMatch result = it->match(path, is_directory);
        if (result != IgnoreMatch::None) {
            return result == IgnoreMatch::Ignore;
        }
    }
    return false;
}

bool DirectoryWalker::classifyChild(const fs::directory_entry& child, EntryKind& kind) {
    std::error_code ec;
    fs::file_status link_status = child.symlink_status(ec);
    if (ec) {
        return false;
    }

    if (fs::is_symlink(link_status)) {
        fs::file_status target = fs::status(child.path(), ec);
        if (ec || !fs::is_regular_file(target)) {
            return false;
        }
        kind = EntryKind::File;
        return true;
    }

    if (fs::is_directory(link_status)) {
        kind = EntryKind::Directory;
        return true;
    }
    if (fs::is_regular_file(link_status)) {
        kind = EntryKind::File;
        return true;
    }
    return false;
}

} // namespace Codefeed
