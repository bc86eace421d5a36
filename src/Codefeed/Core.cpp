// =================================================================
// src/Codefeed/Core.cpp
// =================================================================
// Implementation for the core application logic.

#include "Codefeed/Core.hpp"
#include "Codefeed/Aggregator.hpp"
#include "Codefeed/DirectoryWalker.hpp"
#include "Codefeed/Errors.hpp"
#include "Codefeed/FileReader.hpp"
#include "Codefeed/Logger.hpp"
#include "Codefeed/Reporter.hpp"
#include "Codefeed/Tokenizer.hpp"
#include <string>
#include <system_error>
#include <utility>

namespace Codefeed {

Core::Core(const RunOptions& options, TokenizerFactory tokenizer_factory,
           std::ostream& out, std::ostream& err)
    : m_options(options),
      m_tokenizer_factory(std::move(tokenizer_factory)),
      m_out(out),
      m_err(err),
      m_start_time(std::chrono::steady_clock::now())
{
}

Core::~Core() = default;

int Core::run() {
    std::error_code ec;
    std::filesystem::path current_dir = std::filesystem::current_path(ec);
    if (ec) {
        throw TraversalError("Failed to get current directory: " + ec.message());
    }
    return runAt(current_dir);
}

int Core::runAt(const std::filesystem::path& root_path) {
    m_start_time = std::chrono::steady_clock::now();
    configureLogging();

    DirectoryWalker walker(root_path);
    const Limits limits = m_options.limits();
    Logger::getInstance().logRunStart(walker.rootPath().string(), limits.max_files,
                                      limits.max_total_size, limits.max_file_size);

    Aggregator aggregator(walker.rootPath(), limits);
    RunResult result = aggregator.run(walker);

    Logger::getInstance().logRunSummary(result.entries_seen, result.totals.files_admitted,
                                        result.totals.bytes_admitted, result.binary_files,
                                        result.skipped.size());

    printResult(result);

    if (m_options.report) {
        std::unique_ptr<Tokenizer> tokenizer = createTokenizer();
        Reporter reporter(*tokenizer, walker.rootPath());
        auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(
            std::chrono::steady_clock::now() - m_start_time);
        Report report = reporter.summarize(result.admitted_files, elapsed, result.totals.files_admitted);
        m_out << report.format() << "\n";
    }

    m_out.flush();
    Logger::getInstance().flush();
    return 0;
}

void Core::configureLogging() {
    Logger& logger = Logger::getInstance();

    if (m_options.verbosity > 0) {
        logger.setConsoleLogging(true);
        logger.setConsoleLogLevel(m_options.verbosity > 1 ? LogLevel::DEBUG : LogLevel::INFO);
    }

    if (!m_options.log_file.empty() && !logger.openLogFile(m_options.log_file)) {
        m_err << "[WARN] Cannot open log file: " << m_options.log_file << "\n";
    }
}

void Core::printResult(const RunResult& result) {
    const std::string separator(kSeparatorWidth, '=');

    m_out << result.tree << "\n";

    for (const auto& file : result.admitted_files) {
        m_out << separator << "\n";
        m_out << "File: " << file.relative_path << "\n";
        m_out << separator << "\n";
        m_out << trimTrailingWhitespace(file.content) << "\n";
    }
    m_out.flush();

    for (const auto& skipped : result.skipped) {
        m_err << skipped.message << "\n";
    }
    m_err.flush();
}

std::unique_ptr<Tokenizer> Core::createTokenizer() const {
    std::unique_ptr<Tokenizer> tokenizer;
    if (m_tokenizer_factory) {
        try {
            tokenizer = m_tokenizer_factory(m_options);
        } catch (const TokenizerError& e) {
            LOG_ERROR("Core", std::string("Tokenizer unavailable: ") + e.what());
            throw;
        }
    }
    if (!tokenizer) {
        tokenizer = std::make_unique<HeuristicTokenizer>();
    }
    LOG_INFO("Core", "Tokenizer: " + tokenizer->name());
    return tokenizer;
}

} // namespace Codefeed
