// =================================================================
// src/Kasu/KasuConfig.cpp
// =================================================================
// Implementation for run configuration merging and validation.

#include "Kasu/KasuConfig.hpp"
#include "Kasu/CliParser.hpp"
#include "Kasu/ConfigParser.hpp"
#include "Kasu/Errors.hpp"
#include "Kasu/FormatUtils.hpp"
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace Kasu {

void KasuConfig::applyCommands(const Commands& commands) {
    input = commands.input.value_or("");
    output = commands.output;
    to_stdout = commands.to_stdout;
    format = commands.format.value_or("text");

    tree = commands.tree;
    list = commands.list;
    stats = commands.stats;
    no_merge = commands.no_merge;

    glob = commands.glob.value_or(std::vector<std::string>{});
    ignore_file = commands.ignore_file;
    exclude = commands.exclude.value_or(std::vector<std::string>{});
    if (commands.head) {
        head = static_cast<long long>(*commands.head);
    }
    if (commands.tail) {
        tail = static_cast<long long>(*commands.tail);
    }
    no_auto_ignore = commands.no_auto_ignore;
    max_size = commands.max_size;
    text_only = commands.text_only;

    sanitize = commands.sanitize;
    replace_file = commands.replace_file;

    yes = commands.yes;
    debug = commands.debug;
}

void KasuConfig::mergeConfigFile(const ConfigParser& config, const Commands& commands) {
    if (!config.isLoaded()) {
        return;
    }

    // Boolean flags: the config file can only turn them on
    struct FlagBinding {
        const char* key;
        bool* value;
    };
    const FlagBinding flags[] = {
        {"stdout", &to_stdout},
        {"tree", &tree},
        {"list", &list},
        {"stats", &stats},
        {"no_merge", &no_merge},
        {"yes", &yes},
        {"sanitize", &sanitize},
        {"debug", &debug},
        {"no_auto_ignore", &no_auto_ignore},
        {"text_only", &text_only},
    };
    for (const auto& flag : flags) {
        if (!*flag.value && config.getBoolValue(flag.key)) {
            *flag.value = true;
        }
    }

    if (!commands.input) {
        if (auto value = config.getStringValue("input")) input = *value;
    }
    if (!commands.output) {
        if (auto value = config.getStringValue("output")) output = *value;
    }
    if (!commands.format) {
        if (auto value = config.getStringValue("format")) format = *value;
    }
    if (!commands.ignore_file) {
        if (auto value = config.getStringValue("ignore_file")) ignore_file = *value;
    }
    if (!commands.replace_file) {
        if (auto value = config.getStringValue("replace_file")) replace_file = *value;
    }
    if (!commands.max_size) {
        if (auto value = config.getStringValue("max_size")) max_size = *value;
    }
    if (!commands.head) {
        if (auto value = config.getIntValue("head")) head = *value;
    }
    if (!commands.tail) {
        if (auto value = config.getIntValue("tail")) tail = *value;
    }

    if (!commands.glob) {
        if (auto patterns = config.getPatternList("glob")) glob = *patterns;
    }
    if (!commands.exclude) {
        if (auto patterns = config.getPatternList("exclude")) exclude = *patterns;
    }
}

void KasuConfig::validate() {
    if (input.empty()) {
        throw ValidationError("--input/-i is required (either via command line or config file)");
    }

    if (!to_stdout && !isDisplayOnly() && !output) {
        throw ValidationError("--output/-o is required unless using --stdout, --tree, --list, or --stats");
    }

    if (output && output->find_first_not_of(" \t\r\n") == std::string::npos) {
        throw ValidationError("Output file path cannot be empty");
    }

    if (head && tail) {
        throw ValidationError("Cannot use both --head and --tail at the same time");
    }
    if (head && *head < 1) {
        throw ValidationError("--head must be a positive number of lines");
    }
    if (tail && *tail < 1) {
        throw ValidationError("--tail must be a positive number of lines");
    }

    std::error_code ec;
    if (!std::filesystem::exists(input, ec)) {
        throw ValidationError("Input directory does not exist: " + input);
    }
    if (!std::filesystem::is_directory(input, ec)) {
        throw ValidationError("Input path is not a directory: " + input);
    }

    format = outputFormatName(parseOutputFormat(format));

    // Reject a malformed size before the walk starts
    getMaxFileSize();
}

bool KasuConfig::isDisplayOnly() const {
    return (tree || list || stats) && !output && !to_stdout;
}

OutputFormat KasuConfig::getOutputFormat() const {
    return parseOutputFormat(format);
}

LineWindow KasuConfig::getLineWindow() const {
    LineWindow window;
    if (head) {
        window.head = static_cast<size_t>(*head);
    } else if (tail) {
        window.tail = static_cast<size_t>(*tail);
    }
    return window;
}

std::optional<std::uintmax_t> KasuConfig::getMaxFileSize() const {
    if (!max_size) {
        return std::nullopt;
    }
    try {
        return FormatUtils::parseSize(*max_size);
    } catch (const std::invalid_argument& e) {
        throw ValidationError(e.what());
    }
}

} // namespace Kasu
