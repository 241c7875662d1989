// =================================================================
// include/Kasu/TextGenerator.hpp
// =================================================================
// Header for the plain text rendering.

#pragma once

#include "ContentGenerator.hpp"

namespace Kasu {

/**
 * @brief Plain text rendering
 *
 * Sections start with "=== Title ===" lines. Each file is written as a
 * "--- /path ---" line, its content and a blank separator line.
 */
class TextGenerator final : public ContentGenerator {
public:
    OutputFormat format() const override { return OutputFormat::Text; }

protected:
    void writeStatistics(std::ostringstream& out, const StatisticsSummary& summary) const override;
    void writeTree(std::ostringstream& out, const std::string& tree) const override;
    void writeList(std::ostringstream& out, const std::string& list) const override;
    void writeFile(std::ostringstream& out, const std::string& display_path,
                   const std::string& file_path, const std::string& content) const override;
    void writeFileError(std::ostringstream& out, const std::string& display_path,
                        const std::string& message) const override;
};

} // namespace Kasu
