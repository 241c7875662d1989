// =================================================================
// src/Kasu/FileListBuilder.cpp
// =================================================================
// Implementation for the flat file list view.

#include "Kasu/FileListBuilder.hpp"
#include "Kasu/PathMatcher.hpp"

namespace Kasu {

FileListBuilder::FileListBuilder(const std::string& root_dir)
    : m_root_dir(root_dir)
{
}

std::string FileListBuilder::build(const std::vector<FileRecord>& records) const {
    std::string output;
    for (size_t i = 0; i < records.size(); ++i) {
        if (i > 0) {
            output += '\n';
        }
        // Fall back to the record path when no relative form exists
        auto relative = PathMatcher::makeRelative(records[i].path, m_root_dir);
        output += relative ? *relative : records[i].path;
    }
    return output;
}

} // namespace Kasu
