// =================================================================
// src/Kasu/Core.cpp
// =================================================================
// Implementation of the core application orchestrator.

#include "Kasu/Core.hpp"
#include "Kasu/ConfigParser.hpp"
#include "Kasu/ContentGenerator.hpp"
#include "Kasu/Errors.hpp"
#include "Kasu/FileScanner.hpp"
#include "Kasu/Logger.hpp"
#include "Kasu/Merger.hpp"
#include "Kasu/PathMatcher.hpp"
#include "Kasu/TreeRenderer.hpp"
#include <filesystem>
#include <system_error>

namespace Kasu {

Core::Core(const Commands& commands, std::ostream& out, std::ostream& err, std::istream& in)
    : m_commands(commands),
      m_out(out),
      m_err(err),
      m_in(in)
{
}

int Core::run() {
    try {
        prepareConfig();
    } catch (const ConfigError& e) {
        Logger::getInstance().error("Core", e.what());
        return EXIT_VALIDATION_ERROR;
    } catch (const ValidationError& e) {
        Logger::getInstance().error("Core", e.what());
        return EXIT_VALIDATION_ERROR;
    }

    try {
        return executeMerge();
    } catch (const PatternError& e) {
        Logger::getInstance().error("Core", e.what());
        return EXIT_VALIDATION_ERROR;
    } catch (const OutputWriteError& e) {
        if (e.isPermissionDenied()) {
            Logger::getInstance().error("Core", "Permission denied writing to '" + e.path() + "'",
                                        "check that you have write permissions for this location");
        } else {
            Logger::getInstance().error("Core", e.what());
        }
        return EXIT_WRITE_ERROR;
    }
}

void Core::prepareConfig() {
    // Debug tracing from the command line also covers config loading
    if (m_commands.debug) {
        Logger::getInstance().setConsoleLogLevel(LogLevel::DEBUG);
    }

    ConfigParser config = ConfigParser::load(m_commands.config_file);

    m_config = KasuConfig();
    m_config.applyCommands(m_commands);
    m_config.mergeConfigFile(config, m_commands);
    configureLogging();
    m_config.validate();
}

void Core::configureLogging() const {
    Logger& logger = Logger::getInstance();
    if (m_config.debug) {
        logger.setConsoleLogLevel(LogLevel::DEBUG);
        logger.setShowTimestamps(true);
    }
}

std::vector<std::string> Core::collectIgnorePatterns(bool& auto_vcs_ignore) const {
    std::vector<std::string> ignore_files;
    auto_vcs_ignore = false;

    if (m_config.ignore_file) {
        std::error_code ec;
        if (!std::filesystem::exists(*m_config.ignore_file, ec)) {
            Logger::getInstance().warning("Core", "Ignore file not found: " + *m_config.ignore_file);
        } else {
            ignore_files.push_back(*m_config.ignore_file);
            Logger::getInstance().debug("Core", "Using specified ignore file: " + *m_config.ignore_file);
        }
    } else if (!m_config.no_auto_ignore) {
        auto detected = IgnoreMatcher::autoDetectIgnoreFile(m_config.input);
        if (detected) {
            ignore_files.push_back(*detected);
            auto_vcs_ignore = true;
            Logger::getInstance().info("Core", "Auto-detected and using: " + *detected);
        }
    }

    std::vector<std::string> patterns = IgnoreMatcher::loadPatternsFromFiles(ignore_files);

    if (!m_config.exclude.empty()) {
        Logger::getInstance().debug("Core", "Exclude patterns: " + std::to_string(m_config.exclude.size()));
        patterns.insert(patterns.end(), m_config.exclude.begin(), m_config.exclude.end());
    }

    return patterns;
}

std::vector<ReplacementRule> Core::loadReplacementRules() const {
    if (!m_config.replace_file) {
        return {};
    }

    std::error_code ec;
    if (!std::filesystem::exists(*m_config.replace_file, ec)) {
        Logger::getInstance().warning("Core", "Replacement patterns file not found: " + *m_config.replace_file);
        return {};
    }

    auto rules = Sanitizer::loadReplacementRules(*m_config.replace_file);
    Logger::getInstance().debug("Core", "Loaded " + std::to_string(rules.size()) + " replacement rules");
    return rules;
}

int Core::executeMerge() {
    bool auto_vcs_ignore = false;
    std::vector<std::string> ignore_patterns = collectIgnorePatterns(auto_vcs_ignore);

    GlobMatcher glob_matcher(m_config.input, m_config.glob, m_config.debug);
    IgnoreMatcher ignore_matcher(m_config.input, ignore_patterns, m_config.debug, auto_vcs_ignore);

    ScanOptions scan_options;
    scan_options.max_file_size = m_config.getMaxFileSize();
    scan_options.text_only = m_config.text_only;
    scan_options.debug = m_config.debug;

    FileScanner scanner(glob_matcher, ignore_matcher, scan_options);
    TreeRenderer tree_renderer(glob_matcher, ignore_matcher);
    auto generator = createGenerator(m_config.getOutputFormat());
    Sanitizer sanitizer(m_config.sanitize, loadReplacementRules());

    Merger merger(scanner, *generator, sanitizer, tree_renderer, m_out, m_err, m_in);

    MergeOptions options;
    options.target_dir = m_config.input;
    options.output_file = m_config.output.value_or("");
    options.to_stdout = m_config.to_stdout;
    options.show_tree = m_config.tree;
    options.show_list = m_config.list;
    options.show_stats = m_config.stats;
    options.skip_confirm = m_config.yes;
    options.include_merge = !m_config.no_merge;
    options.window = m_config.getLineWindow();

    merger.merge(options);
    return EXIT_OK;
}

} // namespace Kasu
