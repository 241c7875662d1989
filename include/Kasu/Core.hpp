// =================================================================
// include/Kasu/Core.hpp
// =================================================================
// Defines the core application orchestrator.

#pragma once

#include "Kasu/CliParser.hpp"
#include "Kasu/KasuConfig.hpp"
#include "Kasu/Sanitizer.hpp"
#include <iostream>
#include <string>
#include <vector>

namespace Kasu {

/**
 * @brief Exit statuses of a run
 */
enum ExitCode {
    EXIT_OK = 0,
    EXIT_WRITE_ERROR = 1,       ///< Destination could not be written
    EXIT_VALIDATION_ERROR = 2   ///< Bad parameters, config file or include pattern
};

class Core {
public:
    /**
     * @brief Constructs the Core application object.
     * @param commands The parsed command-line arguments.
     * @param out Console stream
     * @param err Diagnostic stream
     * @param in Confirmation input
     */
    explicit Core(const Commands& commands,
                  std::ostream& out = std::cout,
                  std::ostream& err = std::cerr,
                  std::istream& in = std::cin);

    /**
     * @brief Loads configuration, validates it and runs the merge.
     * @return An integer exit code (0 for success).
     */
    int run();

    /**
     * @brief Settings of the last run, after merging and validation
     */
    const KasuConfig& getConfig() const { return m_config; }

private:
    /**
     * @brief Merge the config file into the command line and validate
     * @throws ConfigError, ValidationError
     */
    void prepareConfig();

    void configureLogging() const;

    /**
     * @brief Collect the exclude patterns of the run
     * @param auto_vcs_ignore Set when the VCS housekeeping patterns apply
     * @return Ignore-file patterns followed by the exclude patterns
     */
    std::vector<std::string> collectIgnorePatterns(bool& auto_vcs_ignore) const;

    std::vector<ReplacementRule> loadReplacementRules() const;

    int executeMerge();

    const Commands& m_commands;
    std::ostream& m_out;
    std::ostream& m_err;
    std::istream& m_in;
    KasuConfig m_config;
};

} // namespace Kasu
