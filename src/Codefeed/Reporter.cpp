// =================================================================
// src/Codefeed/Reporter.cpp
// =================================================================
// Implementation for the run summary.

#include "Codefeed/Reporter.hpp"
#include "Codefeed/Logger.hpp"
#include <iomanip>
#include <sstream>
#include <utility>

namespace Codefeed {

std::string Report::format() const {
    std::ostringstream out;
    out << "Analyzing: " << root_path << "\n";
    out << "Files analyzed: " << files_admitted << "\n";
    out << "Estimated tokens: " << estimated_tokens << "\n";
    out << "Time elapsed: " << formatElapsed(elapsed);
    return out.str();
}

Reporter::Reporter(const Tokenizer& tokenizer, std::filesystem::path root_path)
    : m_tokenizer(tokenizer),
      m_root_path(std::move(root_path))
{
}

Report Reporter::summarize(const std::vector<AdmittedFile>& admitted_files,
                           std::chrono::nanoseconds elapsed,
                           size_t files_admitted) const {
    size_t combined_size = 0;
    for (const auto& file : admitted_files) {
        combined_size += file.content.size();
    }

    std::string combined;
    combined.reserve(combined_size);
    for (const auto& file : admitted_files) {
        combined += file.content;
    }

    Report report;
    report.root_path = m_root_path.string();
    report.files_admitted = files_admitted;
    report.estimated_tokens = m_tokenizer.countTokens(combined);
    report.elapsed = elapsed;

    Logger::getInstance().info("Reporter", "Token estimate: " + std::to_string(report.estimated_tokens),
                                m_tokenizer.name());
    return report;
}

std::string formatElapsed(std::chrono::nanoseconds elapsed) {
    const double ns = static_cast<double>(elapsed.count());

    std::ostringstream out;
    out << std::fixed << std::setprecision(2);
    if (ns >= 1e9) {
        out << ns / 1e9 << "s";
    } else if (ns >= 1e6) {
        out << ns / 1e6 << "ms";
    } else if (ns >= 1e3) {
        out << ns / 1e3 << "µs";
    } else {
        out << ns << "ns";
    }
    return out.str();
}

} // namespace Codefeed
