// =================================================================
// include/Kasu/CliParser.hpp
// =================================================================
// Defines the interface for parsing command-line arguments.
// This class encapsulates all interaction with the CLI11 library.

#pragma once

#include "CLI/CLI.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Kasu {

// Parsed command-line values. Options left off the command line stay
// unset so that configuration file values can fill them in.
struct Commands {
    // Input/Output
    std::optional<std::string> input;
    std::optional<std::string> output;
    bool to_stdout = false;
    std::optional<std::string> format;

    // Information inclusion
    bool tree = false;
    bool list = false;
    bool stats = false;
    bool no_merge = false;

    // Filtering
    std::optional<std::vector<std::string>> glob;
    std::optional<std::string> ignore_file;
    std::optional<std::vector<std::string>> exclude;
    std::optional<size_t> head;
    std::optional<size_t> tail;
    bool no_auto_ignore = false;
    std::optional<std::string> max_size;
    bool text_only = false;

    // Sanitization
    bool sanitize = false;
    std::optional<std::string> replace_file;

    // Execution control
    bool yes = false;
    bool debug = false;
    std::string config_file;
};

class CliParser {
public:
    CliParser() = default;

    /**
     * @brief Sets up all options and flags.
     * @return A shared pointer to the configured CLI::App object.
     */
    std::shared_ptr<CLI::App> setupCli();

    /**
     * @brief Retrieves the parsed command data.
     * @return A const reference to the Commands struct.
     */
    const Commands& getCommands() const;

private:
    void setupInputOutputOptions(CLI::App& app);
    void setupInclusionOptions(CLI::App& app);
    void setupFilterOptions(CLI::App& app);
    void setupSanitizeOptions(CLI::App& app);
    void setupControlOptions(CLI::App& app);

    // Copies the values of options that were actually given into m_commands
    void collectOptionalValues();

    std::shared_ptr<CLI::App> m_app;
    Commands m_commands;

    // Raw storage for options whose presence matters
    std::string m_input;
    std::string m_output;
    std::string m_format;
    std::vector<std::string> m_glob;
    std::string m_ignore_file;
    std::vector<std::string> m_exclude;
    size_t m_head = 0;
    size_t m_tail = 0;
    std::string m_max_size;
    std::string m_replace_file;

    CLI::Option* m_input_option = nullptr;
    CLI::Option* m_output_option = nullptr;
    CLI::Option* m_format_option = nullptr;
    CLI::Option* m_glob_option = nullptr;
    CLI::Option* m_ignore_option = nullptr;
    CLI::Option* m_exclude_option = nullptr;
    CLI::Option* m_head_option = nullptr;
    CLI::Option* m_tail_option = nullptr;
    CLI::Option* m_max_size_option = nullptr;
    CLI::Option* m_replace_option = nullptr;
};

} // namespace Kasu
