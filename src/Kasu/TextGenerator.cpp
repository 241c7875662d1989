// =================================================================
// src/Kasu/TextGenerator.cpp
// =================================================================
// Implementation for the plain text rendering.

#include "Kasu/TextGenerator.hpp"
#include "Kasu/FormatUtils.hpp"

namespace Kasu {

void TextGenerator::writeStatistics(std::ostringstream& out, const StatisticsSummary& summary) const {
    out << "=== Statistics ===\n";
    out << "Total files: " << FormatUtils::formatWithCommas(summary.total_files) << "\n";
    out << "Total lines: " << FormatUtils::formatWithCommas(summary.total_lines) << "\n";
    out << "Total size: " << FormatUtils::formatSize(summary.total_size) << "\n";

    if (!summary.by_extension.empty()) {
        out << "\nBy extension:\n";
        for (const auto& stats : summary.by_extension) {
            out << Statistics::formatExtensionLine(stats) << "\n";
        }
    }

    out << "\n";
}

void TextGenerator::writeTree(std::ostringstream& out, const std::string& tree) const {
    out << "=== Directory Structure ===\n";
    out << tree;
    ensureTrailingNewline(out, tree);
    out << "\n";
}

void TextGenerator::writeList(std::ostringstream& out, const std::string& list) const {
    out << "=== File List ===\n";
    out << list;
    ensureTrailingNewline(out, list);
    out << "\n";
}

void TextGenerator::writeFile(std::ostringstream& out, const std::string& display_path,
                              const std::string&, const std::string& content) const {
    out << "--- " << display_path << " ---\n";
    out << content;
    out << "\n\n";
}

void TextGenerator::writeFileError(std::ostringstream& out, const std::string& display_path,
                                   const std::string& message) const {
    out << "--- " << display_path << " ---\n";
    out << message << "\n\n";
}

} // namespace Kasu
