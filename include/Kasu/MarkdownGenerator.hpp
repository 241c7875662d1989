// =================================================================
// include/Kasu/MarkdownGenerator.hpp
// =================================================================
// Header for the Markdown rendering.

#pragma once

#include "ContentGenerator.hpp"

namespace Kasu {

/**
 * @brief Markdown rendering
 *
 * Sections are "##" headings separated by horizontal rules. Each file is a
 * "### `/path`" heading followed by a code fence tagged with the language
 * from LanguageMap.
 */
class MarkdownGenerator final : public ContentGenerator {
public:
    OutputFormat format() const override { return OutputFormat::Markdown; }

protected:
    void writeStatistics(std::ostringstream& out, const StatisticsSummary& summary) const override;
    void writeTree(std::ostringstream& out, const std::string& tree) const override;
    void writeList(std::ostringstream& out, const std::string& list) const override;
    void writeFilesHeading(std::ostringstream& out) const override;
    void writeFile(std::ostringstream& out, const std::string& display_path,
                   const std::string& file_path, const std::string& content) const override;
    void writeFileError(std::ostringstream& out, const std::string& display_path,
                        const std::string& message) const override;

private:
    static void writeFencedSection(std::ostringstream& out, const std::string& title,
                                   const std::string& body);
};

} // namespace Kasu
