// =================================================================
// src/Kasu/ContentGenerator.cpp
// =================================================================
// Implementation for the shared document assembly pipeline.

#include "Kasu/ContentGenerator.hpp"
#include "Kasu/Errors.hpp"
#include "Kasu/Logger.hpp"
#include "Kasu/MarkdownGenerator.hpp"
#include "Kasu/PathMatcher.hpp"
#include "Kasu/TextFile.hpp"
#include "Kasu/TextGenerator.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace Kasu {

OutputFormat parseOutputFormat(const std::string& name) {
    if (name == "text") {
        return OutputFormat::Text;
    }
    if (name == "markdown" || name == "md") {
        return OutputFormat::Markdown;
    }
    throw ValidationError("Unknown output format '" + name + "' (expected text or markdown)");
}

std::string outputFormatName(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Markdown: return "markdown";
    }
    return "text";
}

std::unique_ptr<ContentGenerator> createGenerator(OutputFormat format) {
    switch (format) {
        case OutputFormat::Markdown:
            return std::make_unique<MarkdownGenerator>();
        case OutputFormat::Text:
            break;
    }
    return std::make_unique<TextGenerator>();
}

GeneratedContent ContentGenerator::generate(const std::vector<FileRecord>& records,
                                            const std::string& root_dir,
                                            const GenerateOptions& options,
                                            const Sanitizer& sanitizer) const {
    GeneratedContent result;
    std::ostringstream out;

    if (options.include_stats) {
        writeStatistics(out, Statistics::calculate(records));
    }

    if (options.include_tree && !options.tree_structure.empty()) {
        writeTree(out, options.tree_structure);
    }

    if (options.include_list && !options.list_structure.empty()) {
        writeList(out, options.list_structure);
    }

    if (options.include_merge) {
        writeFilesHeading(out);

        for (const auto& record : records) {
            const std::string display_path = displayPath(record.path, root_dir);

            std::string content;
            try {
                content = TextFile::read(record.path);
            } catch (const fs::filesystem_error& e) {
                if (e.code() == std::errc::permission_denied) {
                    writeFileError(out, display_path, "[Error: Permission denied reading " + record.path + "]");
                    Logger::getInstance().warning("ContentGenerator", "Permission denied reading " + record.path);
                } else {
                    writeFileError(out, display_path, "[Error reading " + record.path + ": " + e.what() + "]");
                    Logger::getInstance().warning("ContentGenerator", "Failed to read " + record.path, e.what());
                }
                continue;
            }

            content = ContentWindow::apply(content, options.window);

            SanitizeResult sanitized = sanitizer.sanitize(content);
            Sanitizer::mergeStats(result.sanitize_stats, sanitized.stats);

            writeFile(out, display_path, record.path, sanitized.content);
        }
    }

    result.content = out.str();
    return result;
}

std::string ContentGenerator::displayPath(const std::string& file_path, const std::string& root_dir) {
    auto relative = PathMatcher::makeRelative(file_path, root_dir);
    if (!relative) {
        return file_path;
    }
    return "/" + *relative;
}

void ContentGenerator::writeFilesHeading(std::ostringstream&) const {
}

void ContentGenerator::ensureTrailingNewline(std::ostringstream& out, const std::string& text) {
    if (text.empty() || text.back() != '\n') {
        out << '\n';
    }
}

} // namespace Kasu
