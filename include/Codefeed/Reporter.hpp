// =================================================================
// include/Codefeed/Reporter.hpp
// =================================================================
// Summary statistics and token estimate for a completed run.

#pragma once

#include "Codefeed/Aggregator.hpp"
#include "Codefeed/Tokenizer.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace Codefeed {

/**
 * @brief Summary printed after the file contents when --report is given
 */
struct Report {
    std::string root_path;
    size_t files_admitted = 0;
    size_t estimated_tokens = 0;
    std::chrono::nanoseconds elapsed{0};

    /**
     * @brief Render the four report lines (no trailing newline)
     */
    std::string format() const;
};

class Reporter {
public:
    /**
     * @brief Construct a reporter
     * @param tokenizer Token counting backend; must outlive the reporter
     * @param root_path Traversal root shown in the report
     */
    Reporter(const Tokenizer& tokenizer, std::filesystem::path root_path);

    /**
     * @brief Build the report for a run
     *
     * Contents are concatenated with no separator before counting.
     *
     * @param admitted_files Files whose content was kept
     * @param elapsed Wall-clock time since the run started
     * @param files_admitted Count from the running totals
     */
    Report summarize(const std::vector<AdmittedFile>& admitted_files,
                     std::chrono::nanoseconds elapsed,
                     size_t files_admitted) const;

private:
    const Tokenizer& m_tokenizer;
    std::filesystem::path m_root_path;
};

/**
 * @brief Format a duration with two decimals in s, ms, µs or ns (e.g. "12.35ms")
 */
std::string formatElapsed(std::chrono::nanoseconds elapsed);

} // namespace Codefeed
