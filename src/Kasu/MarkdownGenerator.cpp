// =================================================================
// src/Kasu/MarkdownGenerator.cpp
// =================================================================
// Implementation for the Markdown rendering.

#include "Kasu/MarkdownGenerator.hpp"
#include "Kasu/FormatUtils.hpp"
#include "Kasu/LanguageMap.hpp"

namespace Kasu {

void MarkdownGenerator::writeStatistics(std::ostringstream& out, const StatisticsSummary& summary) const {
    out << "## Summary\n\n";
    out << "- **Total files**: " << summary.total_files << "\n";
    out << "- **Total lines**: " << FormatUtils::formatWithCommas(summary.total_lines) << "\n";
    out << "- **Total size**: " << FormatUtils::formatSize(summary.total_size) << "\n\n";

    if (!summary.by_extension.empty()) {
        out << "### By Extension\n\n";
        out << "| Extension | Files | Lines | Size |\n";
        out << "|-----------|-------|-------|------|\n";
        for (const auto& stats : summary.by_extension) {
            out << "| " << stats.extension
                << " | " << stats.count
                << " | " << FormatUtils::formatWithCommas(stats.lines)
                << " | " << FormatUtils::formatSize(stats.size) << " |\n";
        }
        out << "\n";
    }

    out << "---\n\n";
}

void MarkdownGenerator::writeTree(std::ostringstream& out, const std::string& tree) const {
    writeFencedSection(out, "Directory Structure", tree);
}

void MarkdownGenerator::writeList(std::ostringstream& out, const std::string& list) const {
    writeFencedSection(out, "File List", list);
}

void MarkdownGenerator::writeFilesHeading(std::ostringstream& out) const {
    out << "## Files\n\n";
}

void MarkdownGenerator::writeFile(std::ostringstream& out, const std::string& display_path,
                                  const std::string& file_path, const std::string& content) const {
    out << "### `" << display_path << "`\n\n";
    out << "```" << LanguageMap::getLanguage(file_path) << "\n";
    out << content;
    ensureTrailingNewline(out, content);
    out << "```\n\n";
}

void MarkdownGenerator::writeFileError(std::ostringstream& out, const std::string& display_path,
                                       const std::string& message) const {
    out << "### `" << display_path << "`\n\n";
    out << "```text\n" << message << "\n```\n\n";
}

void MarkdownGenerator::writeFencedSection(std::ostringstream& out, const std::string& title,
                                           const std::string& body) {
    out << "## " << title << "\n\n";
    out << "```\n";
    out << body;
    ensureTrailingNewline(out, body);
    out << "```\n\n";
    out << "---\n\n";
}

} // namespace Kasu
