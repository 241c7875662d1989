// =================================================================
// include/Kasu/KasuConfig.hpp
// =================================================================
// Configuration structure holding the settings of one run.

#pragma once

#include "ContentGenerator.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Kasu {

struct Commands;
class ConfigParser;

/**
 * @brief Settings of one run, merged from the command line and the config file
 *
 * Command-line values always win. A boolean flag is on when either source
 * turns it on; any other value comes from the config file only when the
 * command line left it unset.
 */
struct KasuConfig {
    // Input/Output
    std::string input;
    std::optional<std::string> output;
    bool to_stdout = false;
    std::string format = "text";

    // Information inclusion
    bool tree = false;
    bool list = false;
    bool stats = false;
    bool no_merge = false;

    // Filtering
    std::vector<std::string> glob;
    std::optional<std::string> ignore_file;
    std::vector<std::string> exclude;
    std::optional<long long> head;
    std::optional<long long> tail;
    bool no_auto_ignore = false;
    std::optional<std::string> max_size;
    bool text_only = false;

    // Sanitization
    bool sanitize = false;
    std::optional<std::string> replace_file;

    // Execution control
    bool yes = false;
    bool debug = false;

    /**
     * @brief Take the values given on the command line
     * @param commands Parsed command line
     */
    void applyCommands(const Commands& commands);

    /**
     * @brief Fill in what the command line left unset
     * @param config Loaded configuration file
     * @param commands Parsed command line, used to tell given options apart
     */
    void mergeConfigFile(const ConfigParser& config, const Commands& commands);

    /**
     * @brief Check the merged settings before any file is touched
     *
     * Also normalizes "md" to "markdown".
     *
     * @throws ValidationError describing the first problem found
     */
    void validate();

    /**
     * @brief Check whether only views are displayed and nothing is written
     */
    bool isDisplayOnly() const;

    OutputFormat getOutputFormat() const;

    /**
     * @brief Line window built from head/tail
     */
    LineWindow getLineWindow() const;

    /**
     * @brief Parsed --max-size limit
     * @throws ValidationError if the size string is malformed
     */
    std::optional<std::uintmax_t> getMaxFileSize() const;
};

} // namespace Kasu
