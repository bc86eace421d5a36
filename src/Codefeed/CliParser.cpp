// =================================================================
// src/Codefeed/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Codefeed/CliParser.hpp"

namespace Codefeed {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Codefeed: feed your codebase into any LLM.", "codefeed");
    m_app->set_version_flag("--version", CODEFEED_VERSION);
    m_app->footer("Walks the current directory, honoring .gitignore and .ignore files.\n"
                  "Skipped files are listed on stderr.");

    setupLimitOptions(*m_app);
    setupReportOptions(*m_app);
    setupLoggingOptions(*m_app);

    return m_app;
}

const RunOptions& CliParser::getOptions() const {
    return m_options;
}

void CliParser::setupLimitOptions(CLI::App& app) {
    app.add_option("-f,--file-size", m_options.max_file_size, "Maximum file size to process (in bytes)")
        ->envname("CODEFEED_FILE_SIZE")
        ->capture_default_str();
    app.add_option("-t,--total-size", m_options.max_total_size, "Maximum total size of files to process (in bytes)")
        ->envname("CODEFEED_TOTAL_SIZE")
        ->capture_default_str();
    app.add_option("-n,--num-files", m_options.max_files, "Maximum number of files to process")
        ->envname("CODEFEED_NUM_FILES")
        ->capture_default_str();
}

void CliParser::setupReportOptions(CLI::App& app) {
    app.add_flag("-r,--report", m_options.report, "Output the report (file count, estimated tokens, time).");
    app.add_option("--tokenizer-model", m_options.tokenizer_model,
                   "GGUF model whose vocabulary is used to count tokens (default: ~4 bytes per token)")
        ->envname("CODEFEED_TOKENIZER_MODEL")
        ->check(CLI::ExistingFile);
}

void CliParser::setupLoggingOptions(CLI::App& app) {
    app.add_flag("-v,--verbose", m_options.verbosity, "Diagnostic logging on stderr (-vv for debug)");
    app.add_option("--log-file", m_options.log_file, "Append diagnostic logs to this file");
}

} // namespace Codefeed
