// =================================================================
// include/Codefeed/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include "Codefeed/RunOptions.hpp"
#include <memory>
#include <string>

namespace Codefeed {

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed options.
     * @return A const reference to the RunOptions struct.
     */
    const RunOptions& getOptions() const;

private:
    void setupLimitOptions(CLI::App& app);
    void setupReportOptions(CLI::App& app);
    void setupLoggingOptions(CLI::App& app);

    std::shared_ptr<CLI::App> m_app;
    RunOptions m_options;
};

} // namespace Codefeed
