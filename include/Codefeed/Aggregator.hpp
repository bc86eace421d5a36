// =================================================================
// include/Codefeed/Aggregator.hpp
// =================================================================
// Drives a traversal: applies limits and classification to every file,
// collects admitted contents and skip records, and feeds the tree.

#pragma once

#include "Codefeed/DirectoryWalker.hpp"
#include "Codefeed/FileClassifier.hpp"
#include "Codefeed/Limiter.hpp"
#include "Codefeed/TreeRenderer.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace Codefeed {

/**
 * @brief A file whose content made it into the output
 */
struct AdmittedFile {
    std::filesystem::path path;   ///< Absolute path
    std::string relative_path;    ///< Path below the root, as printed in the header
    std::string content;          ///< Validated UTF-8 text
    std::uint64_t size;           ///< On-disk size used for admission
};

/**
 * @brief A file left out of the output, and why
 */
struct SkipRecord {
    std::filesystem::path path;
    SkipReason reason;
    std::string message;          ///< Line printed to stderr
};

/**
 * @brief Everything a completed traversal produced
 */
struct RunResult {
    std::string tree;                          ///< Rendered tree, trailing whitespace trimmed
    std::vector<AdmittedFile> admitted_files;  ///< Traversal order
    std::vector<SkipRecord> skipped;           ///< Traversal order
    RunningTotals totals;

    size_t entries_seen = 0;
    size_t directories = 0;
    size_t binary_files = 0;
};

/**
 * @brief Single-pass orchestrator over an entry stream
 *
 * For each file: look up its size, ask the Limiter, classify, then read.
 * Totals are committed only after the content has been read successfully,
 * so a file that fails late never counts toward the limits. Limit-skipped
 * and unreadable files get no tree line; binary files get an annotated one.
 */
class Aggregator {
public:
    /**
     * @brief Prepare a run with the default classifier
     * @param root_path Absolute traversal root; every entry must lie below it
     * @param limits Ceilings for this run
     */
    Aggregator(const std::filesystem::path& root_path, const Limits& limits);

    /**
     * @brief Prepare a run with a caller-supplied classifier
     * @param classifier Text/binary classifier; must outlive the Aggregator
     */
    Aggregator(const std::filesystem::path& root_path, const Limits& limits,
               const FileClassifier& classifier);

    Aggregator(const Aggregator&) = delete;
    Aggregator& operator=(const Aggregator&) = delete;

    /**
     * @brief Consume the whole stream and return the result
     * @param source Entries to process; the first one must be the root
     * @throws TraversalError if an entry lies outside the root
     */
    RunResult run(EntrySource& source);

    /**
     * @brief Process a single entry
     * @throws TraversalError if the entry lies outside the root
     */
    void visit(const Entry& entry);

    /**
     * @brief Move the accumulated result out; the Aggregator is spent afterwards
     */
    RunResult takeResult();

    const RunningTotals& totals() const { return m_limiter.totals(); }

private:
    std::filesystem::path m_root;
    FileClassifier m_default_classifier;
    const FileClassifier& m_classifier;
    Limiter m_limiter;
    TreeRenderer m_tree;
    RunResult m_result;

    void visitFile(const Entry& entry, const std::filesystem::path& relative);
    void skip(const std::filesystem::path& path, SkipReason reason, const std::string& message);

    /**
     * @brief Express a path relative to the root
     * @throws TraversalError if the path is not strictly below the root
     */
    std::filesystem::path relativeToRoot(const std::filesystem::path& path) const;

    static size_t segmentCount(const std::filesystem::path& relative);
    static std::string rootName(const std::filesystem::path& root);
};

} // namespace Codefeed
