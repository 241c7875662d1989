// =================================================================
// include/Kasu/FileListBuilder.hpp
// =================================================================
// Header for the flat file list view.

#pragma once

#include "FileScanner.hpp"
#include <string>
#include <vector>

namespace Kasu {

/**
 * @brief Renders scan records as root-relative paths, one per line
 */
class FileListBuilder {
public:
    explicit FileListBuilder(const std::string& root_dir);

    /**
     * @brief Render the records in the order given
     * @param records Accepted files
     * @return Paths joined by '\n', without a trailing newline
     */
    std::string build(const std::vector<FileRecord>& records) const;

private:
    std::string m_root_dir;
};

} // namespace Kasu
