// =================================================================
// src/Kasu/CliParser.cpp
// =================================================================
// Implementation for the CLI parser.

#include "Kasu/CliParser.hpp"

namespace Kasu {

std::shared_ptr<CLI::App> CliParser::setupCli() {
    m_app = std::make_shared<CLI::App>("Kasu: merge all text files in a directory into one output.");
    m_app->footer(
        "Examples:\n"
        "  ks -i . -o output.txt                       # Basic merge\n"
        "  ks -i . -o output.md -f md                  # Markdown format\n"
        "  ks -i . -o output.txt -t                    # With tree\n"
        "  ks -i . -o output.txt --head 100            # First 100 lines per file\n"
        "  ks -i . -t                                  # Display tree only\n"
        "  ks -i . -o output.txt -g '*.py' '*.js'      # Python and JS only\n"
        "  ks -i . -o output.txt -g '*.py' -x 'test_*' # Combine glob and exclude\n"
        "  ks -i project/ -o out.txt -s                # Auto-sanitize sensitive info\n"
        "  ks -c config.yaml -o custom.txt             # Config + override");

    // Store which optional values were given once parsing succeeded
    m_app->callback([this]() { collectOptionalValues(); });

    setupInputOutputOptions(*m_app);
    setupInclusionOptions(*m_app);
    setupFilterOptions(*m_app);
    setupSanitizeOptions(*m_app);
    setupControlOptions(*m_app);

    return m_app;
}

const Commands& CliParser::getCommands() const {
    return m_commands;
}

void CliParser::setupInputOutputOptions(CLI::App& app) {
    m_input_option = app.add_option("-i,--input", m_input, "Directory to search for text files")
        ->type_name("DIR")->group("Input/Output");
    m_output_option = app.add_option("-o,--output", m_output, "Output file path")
        ->type_name("FILE")->group("Input/Output");
    app.add_flag("--stdout", m_commands.to_stdout, "Output to stdout instead of file")
        ->group("Input/Output");
    m_format_option = app.add_option("-f,--format", m_format, "Output format (default: text)")
        ->check(CLI::IsMember({"text", "markdown", "md"}))->group("Input/Output");
}

void CliParser::setupInclusionOptions(CLI::App& app) {
    const std::string group = "Information inclusion";
    app.add_flag("-t,--tree", m_commands.tree, "Include directory tree structure")->group(group);
    app.add_flag("-l,--list", m_commands.list, "Include file list")->group(group);
    app.add_flag("--stats", m_commands.stats, "Include file statistics")->group(group);
    app.add_flag("--no-merge", m_commands.no_merge, "Exclude file contents (only output metadata)")->group(group);
}

void CliParser::setupFilterOptions(CLI::App& app) {
    const std::string group = "Filtering";
    m_glob_option = app.add_option("-g,--glob", m_glob,
        "File patterns to match (e.g., '*.py' 'src/**/*.js')")->type_name("PATTERN")->group(group);
    m_ignore_option = app.add_option("--ignore", m_ignore_file,
        "Ignore patterns file (default: auto-detect .gitignore)")->type_name("FILE")->group(group);
    m_exclude_option = app.add_option("-x,--exclude", m_exclude,
        "Exclude patterns (e.g., 'README.md' '*.log' 'temp/*')")->type_name("PATTERN")->group(group);
    m_head_option = app.add_option("--head", m_head, "Limit each file to first N lines")
        ->type_name("N")->check(CLI::PositiveNumber)->group(group);
    m_tail_option = app.add_option("--tail", m_tail, "Limit each file to last N lines")
        ->type_name("N")->check(CLI::PositiveNumber)->group(group);
    m_head_option->excludes(m_tail_option);
    app.add_flag("--no-auto-ignore", m_commands.no_auto_ignore, "Disable automatic .gitignore detection")
        ->group(group);
    m_max_size_option = app.add_option("--max-size", m_max_size,
        "Skip files larger than SIZE (e.g., 500K, 1.5M)")->type_name("SIZE")->group(group);
    app.add_flag("--text-only", m_commands.text_only, "Skip files that do not look like text")
        ->group(group);
}

void CliParser::setupSanitizeOptions(CLI::App& app) {
    const std::string group = "Sanitization";
    app.add_flag("-s,--sanitize", m_commands.sanitize, "Auto-sanitize sensitive information")->group(group);
    m_replace_option = app.add_option("-r,--replace", m_replace_file, "Custom replacement patterns file")
        ->type_name("FILE")->group(group);
}

void CliParser::setupControlOptions(CLI::App& app) {
    const std::string group = "Execution control";
    app.add_flag("-y,--yes", m_commands.yes, "Skip confirmation prompt")->group(group);
    app.add_flag("-d,--debug", m_commands.debug, "Show debug information")->group(group);
    app.add_option("-c,--config", m_commands.config_file, "Configuration file path (YAML format)")
        ->type_name("FILE");
}

void CliParser::collectOptionalValues() {
    if (m_input_option->count() > 0) m_commands.input = m_input;
    if (m_output_option->count() > 0) m_commands.output = m_output;
    if (m_format_option->count() > 0) m_commands.format = m_format;
    if (m_glob_option->count() > 0) m_commands.glob = m_glob;
    if (m_ignore_option->count() > 0) m_commands.ignore_file = m_ignore_file;
    if (m_exclude_option->count() > 0) m_commands.exclude = m_exclude;
    if (m_head_option->count() > 0) m_commands.head = m_head;
    if (m_tail_option->count() > 0) m_commands.tail = m_tail;
    if (m_max_size_option->count() > 0) m_commands.max_size = m_max_size;
    if (m_replace_option->count() > 0) m_commands.replace_file = m_replace_file;
}

} // namespace Kasu
