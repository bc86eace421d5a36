// =================================================================
// src/Codefeed/Limiter.cpp
// =================================================================
// Implementation for file admission limits.

#include "Codefeed/Limiter.hpp"
#include <iomanip>
#include <limits>
#include <sstream>

namespace Codefeed {

std::string skipReasonName(SkipReason reason) {
    switch (reason) {
        case SkipReason::FileCountLimit: return "file-count-limit";
        case SkipReason::TotalSizeLimit: return "total-size-limit";
        case SkipReason::FileSizeLimit: return "per-file-size-limit";
        case SkipReason::ReadError: return "read-error";
        case SkipReason::ClassificationError: return "classification-error";
        default: return "unknown";
    }
}

Limiter::Limiter(const Limits& limits)
    : m_limits(limits)
{
}

const std::vector<Limiter::Rule>& Limiter::rules() {
    // Order matters: a candidate can trip more than one rule.
    static const std::vector<Rule> chain = {
        {SkipReason::FileCountLimit,
         [](const Limits& limits, const RunningTotals& totals, std::uint64_t) {
             return totals.files_admitted >= limits.max_files;
         }},
        {SkipReason::TotalSizeLimit,
         [](const Limits& limits, const RunningTotals& totals, std::uint64_t size) {
             if (size > std::numeric_limits<std::uint64_t>::max() - totals.bytes_admitted) {
                 return true;
             }
             return totals.bytes_admitted + size > limits.max_total_size;
         }},
        {SkipReason::FileSizeLimit,
         [](const Limits& limits, const RunningTotals&, std::uint64_t size) {
             return size > limits.max_file_size;
         }},
    };
    return chain;
}

AdmitDecision Limiter::admit(std::uint64_t candidate_size) const {
    for (const auto& rule : rules()) {
        if (rule.exceeded(m_limits, m_totals, candidate_size)) {
            return AdmitDecision::reject(rule.reason);
        }
    }
    return AdmitDecision::admit();
}

void Limiter::commit(std::uint64_t size) {
    m_totals.files_admitted++;
    m_totals.bytes_admitted += size;
}

std::string Limiter::describeRejection(SkipReason reason) const {
    switch (reason) {
        case SkipReason::FileCountLimit:
            return "Maximum file limit (" + std::to_string(m_limits.max_files) + ") reached";
        case SkipReason::TotalSizeLimit:
            return "Total size limit (" + formatSize(m_limits.max_total_size) + ") reached";
        case SkipReason::FileSizeLimit:
            return "File exceeds maximum size (" + formatSize(m_limits.max_file_size) + ")";
        default:
            return skipReasonName(reason);
    }
}

std::string formatSize(std::uint64_t size) {
    std::ostringstream out;
    if (size < 1024) {
        out << size << " bytes";
    } else if (size < 1024 * 1024) {
        out << std::fixed << std::setprecision(2) << static_cast<double>(size) / 1024.0 << " KB";
    } else {
        out << std::fixed << std::setprecision(2) << static_cast<double>(size) / (1024.0 * 1024.0) << " MB";
    }
    return out.str();
}

} // namespace Codefeed
