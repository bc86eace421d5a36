// =================================================================
// include/Codefeed/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Codefeed/RunOptions.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>

namespace Codefeed {

class Tokenizer;
struct RunResult;

class Core {
public:
    // Builds the tokenizer on demand; only called when a report is requested.
    using TokenizerFactory = std::function<std::unique_ptr<Tokenizer>(const RunOptions&)>;

    /**
     * @brief Constructs the Core application object.
     * @param options The parsed command-line options.
     * @param tokenizer_factory Tokenizer backend for the report; the
     *        character estimator when empty.
     * @param out Stream receiving the tree, file contents and report.
     * @param err Stream receiving one line per skipped file.
     */
    explicit Core(const RunOptions& options,
                  TokenizerFactory tokenizer_factory = TokenizerFactory(),
                  std::ostream& out = std::cout,
                  std::ostream& err = std::cerr);

    ~Core();

    /**
     * @brief Runs over the current working directory.
     * @return An integer exit code (0 for success).
     * @throws TraversalError or TokenizerError on fatal errors.
     */
    int run();

    /**
     * @brief Runs over an explicit root directory.
     */
    int runAt(const std::filesystem::path& root_path);

    static constexpr size_t kSeparatorWidth = 50;

private:
    void configureLogging();
    void printResult(const RunResult& result);
    std::unique_ptr<Tokenizer> createTokenizer() const;

    const RunOptions& m_options;
    TokenizerFactory m_tokenizer_factory;
    std::ostream& m_out;
    std::ostream& m_err;
    std::chrono::steady_clock::time_point m_start_time;
};

} // namespace Codefeed
