// =================================================================
// include/Codefeed/Limiter.hpp
// =================================================================
// Admission control for candidate files: file count, cumulative size
// and per-file size ceilings over a single run.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Codefeed {

/**
 * @brief Why a file was left out of the output
 */
enum class SkipReason {
    FileCountLimit,       ///< max_files already admitted
    TotalSizeLimit,       ///< would push the cumulative size past max_total_size
    FileSizeLimit,        ///< larger than max_file_size on its own
    ReadError,            ///< metadata or content could not be read
    ClassificationError   ///< leading bytes could not be sampled
};

/**
 * @brief Stable tag for a skip reason (e.g. "file-count-limit")
 */
std::string skipReasonName(SkipReason reason);

/**
 * @brief The three ceilings of a run
 */
struct Limits {
    static constexpr size_t kDefaultMaxFiles = 10000;
    static constexpr std::uint64_t kDefaultMaxTotalSize = 100ULL * 1024 * 1024;  // 100MB
    static constexpr std::uint64_t kDefaultMaxFileSize = 1024 * 1024;            // 1MB

    size_t max_files = kDefaultMaxFiles;
    std::uint64_t max_total_size = kDefaultMaxTotalSize;
    std::uint64_t max_file_size = kDefaultMaxFileSize;
};

/**
 * @brief Running totals of committed files
 */
struct RunningTotals {
    size_t files_admitted = 0;
    std::uint64_t bytes_admitted = 0;
};

/**
 * @brief Result of an admission check
 */
struct AdmitDecision {
    bool admitted;
    SkipReason reason;  ///< Meaningful only when !admitted

    static AdmitDecision admit() { return {true, SkipReason::FileCountLimit}; }
    static AdmitDecision reject(SkipReason why) { return {false, why}; }
};

/**
 * @brief Stateful gatekeeper for the three limits
 *
 * Rules are evaluated in a fixed order and the first one that trips wins:
 * file count, then cumulative size, then per-file size. Admission does not
 * touch the totals; the caller commits the size once the file's content has
 * actually been stored, so a later read failure never inflates the totals.
 */
class Limiter {
public:
    explicit Limiter(const Limits& limits);

    /**
     * @brief Check whether a file of the given size may be admitted
     * @param candidate_size On-disk size of the candidate (bytes)
     * @return Admit, or Reject with the first rule that tripped
     */
    AdmitDecision admit(std::uint64_t candidate_size) const;

    /**
     * @brief Add an admitted file to the running totals
     * @param size The same size that was passed to admit()
     */
    void commit(std::uint64_t size);

    /**
     * @brief Human-readable explanation of a limit rejection
     * @param reason One of the three limit reasons
     * @return e.g. "Maximum file limit (10) reached"
     */
    std::string describeRejection(SkipReason reason) const;

    const RunningTotals& totals() const { return m_totals; }
    const Limits& limits() const { return m_limits; }

private:
    struct Rule {
        SkipReason reason;
        bool (*exceeded)(const Limits& limits, const RunningTotals& totals, std::uint64_t candidate_size);
    };

    static const std::vector<Rule>& rules();

    const Limits m_limits;
    RunningTotals m_totals;
};

/**
 * @brief Format a byte count as "N bytes", "X.XX KB" or "X.XX MB"
 */
std::string formatSize(std::uint64_t size);

} // namespace Codefeed
