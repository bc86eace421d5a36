// =================================================================
// src/Codefeed/Aggregator.cpp
// =================================================================
// Implementation for the traversal orchestrator.

#include "Codefeed/Aggregator.hpp"
#include "Codefeed/Errors.hpp"
#include "Codefeed/FileReader.hpp"
#include "Codefeed/Logger.hpp"
#include <utility>

namespace fs = std::filesystem;

namespace Codefeed {

Aggregator::Aggregator(const fs::path& root_path, const Limits& limits)
    : m_root(root_path),
      m_classifier(m_default_classifier),
      m_limiter(limits)
{
}

Aggregator::Aggregator(const fs::path& root_path, const Limits& limits,
                       const FileClassifier& classifier)
    : m_root(root_path),
      m_classifier(classifier),
      m_limiter(limits)
{
}

RunResult Aggregator::run(EntrySource& source) {
    Entry entry;
    while (source.next(entry)) {
        visit(entry);
    }
    return takeResult();
}

void Aggregator::visit(const Entry& entry) {
    m_result.entries_seen++;

    if (entry.kind == EntryKind::Root) {
        m_tree.visitRoot(rootName(entry.path));
        return;
    }

    fs::path relative = relativeToRoot(entry.path);

    if (entry.kind == EntryKind::Directory) {
        m_result.directories++;
        m_tree.visitDirectory(relative.filename().string(), segmentCount(relative));
        return;
    }

    visitFile(entry, relative);
}

RunResult Aggregator::takeResult() {
    m_result.tree = m_tree.str();
    m_result.totals = m_limiter.totals();
    return std::move(m_result);
}

void Aggregator::visitFile(const Entry& entry, const fs::path& relative) {
    const fs::path& path = entry.path;
    const std::string name = relative.filename().string();
    const size_t depth = segmentCount(relative);

    std::uint64_t size = 0;
    try {
        size = fileSize(path);
    } catch (const FileAccessError& e) {
        skip(path, SkipReason::ReadError,
             "Failed to get metadata for file: " + path.string() + ": " + e.what());
        return;
    }

    AdmitDecision decision = m_limiter.admit(size);
    if (!decision.admitted) {
        skip(path, decision.reason,
             "Skipping file " + path.string() + ": " + m_limiter.describeRejection(decision.reason));
        return;
    }

    bool is_text = false;
    try {
        is_text = m_classifier.isTextFile(path);
    } catch (const FileAccessError& e) {
        skip(path, SkipReason::ClassificationError,
             "Error checking if file is text: " + path.string() + ": " + e.what());
        return;
    }

    if (!is_text) {
        m_result.binary_files++;
        m_tree.visitFile(name, depth, FileOutcome::NonText);
        LOG_DEBUG("Aggregator", "Non-text file: " + path.string());
        return;
    }

    std::string content;
    try {
        content = readTextFile(path);
    } catch (const FileAccessError& e) {
        skip(path, SkipReason::ReadError,
             "Error reading file " + path.string() + ": " + e.what());
        return;
    }

    m_limiter.commit(size);
    m_result.admitted_files.push_back(AdmittedFile{path, relative.string(), std::move(content), size});
    m_tree.visitFile(name, depth, FileOutcome::Included);
    Logger::getInstance().debug("Aggregator", "Admitted: " + relative.string(), std::to_string(size) + " bytes");
}

void Aggregator::skip(const fs::path& path, SkipReason reason, const std::string& message) {
    LOG_DEBUG("Aggregator", "Skipped (" + skipReasonName(reason) + "): " + path.string());
    m_result.skipped.push_back(SkipRecord{path, reason, message});
}

fs::path Aggregator::relativeToRoot(const fs::path& path) const {
    fs::path relative = path.lexically_relative(m_root);
    if (relative.empty() || relative == "." || *relative.begin() == "..") {
        throw TraversalError("Failed to strip prefix for path: " + path.string());
    }
    return relative;
}

size_t Aggregator::segmentCount(const fs::path& relative) {
    size_t count = 0;
    for (auto it = relative.begin(); it != relative.end(); ++it) {
        count++;
    }
    return count;
}

std::string Aggregator::rootName(const fs::path& root) {
    std::string name = root.filename().string();
    return name.empty() ? "." : name;
}

} // namespace Codefeed
