// =================================================================
// include/Kasu/ContentGenerator.hpp
// =================================================================
// Header for assembling the merged output document.

#pragma once

#include "ContentWindow.hpp"
#include "FileScanner.hpp"
#include "Sanitizer.hpp"
#include "Statistics.hpp"
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace Kasu {

/**
 * @brief Supported renderings of the merged document
 */
enum class OutputFormat {
    Text,
    Markdown
};

/**
 * @brief Parse a format name
 * @param name "text", "markdown" or "md"
 * @return Matching format
 * @throws ValidationError for any other name
 */
OutputFormat parseOutputFormat(const std::string& name);

/**
 * @brief Canonical name of a format ("text" or "markdown")
 */
std::string outputFormatName(OutputFormat format);

/**
 * @brief Sections to include and the per-file content pipeline settings
 */
struct GenerateOptions {
    bool include_stats = false;
    bool include_tree = false;
    bool include_list = false;
    bool include_merge = true;      ///< Emit the file bodies
    std::string tree_structure;     ///< Rendered tree, used verbatim
    std::string list_structure;     ///< Rendered file list, used verbatim
    LineWindow window;
};

/**
 * @brief The merged document and the redactions made while building it
 */
struct GeneratedContent {
    std::string content;
    SanitizeStats sanitize_stats;
};

/**
 * @brief Builds the output document from scan records
 *
 * Sections are emitted in a fixed order: statistics, tree, file list, file
 * bodies. Each file body goes through windowing and then sanitization.
 * A file that cannot be read is replaced by an error placeholder and a
 * warning; the rest of the document is unaffected.
 *
 * Subclasses only decide how each piece is rendered.
 */
class ContentGenerator {
public:
    virtual ~ContentGenerator() = default;

    /**
     * @brief Assemble the document
     * @param records Files in output order
     * @param root_dir Directory the display paths are relative to
     * @param options Sections and windowing
     * @param sanitizer Redaction applied to every file body
     * @return Document text and accumulated sanitize counts
     */
    GeneratedContent generate(const std::vector<FileRecord>& records,
                              const std::string& root_dir,
                              const GenerateOptions& options,
                              const Sanitizer& sanitizer) const;

    virtual OutputFormat format() const = 0;

    /**
     * @brief Display path of a file: root-relative with a leading slash
     * @param file_path Record path
     * @param root_dir Merge root
     * @return "/sub/file.txt", or file_path itself when it has no relative form
     */
    static std::string displayPath(const std::string& file_path, const std::string& root_dir);

protected:
    virtual void writeStatistics(std::ostringstream& out, const StatisticsSummary& summary) const = 0;
    virtual void writeTree(std::ostringstream& out, const std::string& tree) const = 0;
    virtual void writeList(std::ostringstream& out, const std::string& list) const = 0;
    virtual void writeFilesHeading(std::ostringstream& out) const;
    virtual void writeFile(std::ostringstream& out, const std::string& display_path,
                           const std::string& file_path, const std::string& content) const = 0;
    virtual void writeFileError(std::ostringstream& out, const std::string& display_path,
                                const std::string& message) const = 0;

    /**
     * @brief Append a newline unless the text already ends with one
     */
    static void ensureTrailingNewline(std::ostringstream& out, const std::string& text);
};

/**
 * @brief Create the generator for a format
 * @param format Requested rendering
 * @return Owned generator
 */
std::unique_ptr<ContentGenerator> createGenerator(OutputFormat format);

} // namespace Kasu
