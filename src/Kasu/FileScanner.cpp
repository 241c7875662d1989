// =================================================================
// src/Kasu/FileScanner.cpp
// =================================================================
// Implementation for the filtered directory walk.

#include "Kasu/FileScanner.hpp"
#include "Kasu/FormatUtils.hpp"
#include "Kasu/Logger.hpp"
#include "Kasu/TextFile.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace Kasu {

FileScanner::FileScanner(const GlobMatcher& glob_matcher, const IgnoreMatcher& ignore_matcher,
                         ScanOptions options)
    : m_glob_matcher(glob_matcher),
      m_ignore_matcher(ignore_matcher),
      m_options(options)
{
}

ScanResult FileScanner::scan(const std::string& root_dir) const {
    ScanResult result;
    walkDirectory(fs::path(root_dir), result);

    if (m_options.debug) {
        Logger::getInstance().logScanSummary(result.stats);
    }
    return result;
}

void FileScanner::walkDirectory(const fs::path& directory, ScanResult& result) const {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        // Unlistable directories contribute nothing
        if (m_options.debug) {
            Logger::getInstance().debug("FileScanner", "Cannot list directory: " + directory.string(),
                                        ec.message());
        }
        return;
    }

    std::vector<fs::path> subdirectories;
    std::vector<fs::path> files;

    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const fs::directory_entry& entry = *it;

        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec)) {
            if (m_options.debug) {
                Logger::getInstance().debug("FileScanner", "Skipped symlink: " + entry.path().string());
            }
            continue;
        }
        if (entry.is_directory(entry_ec)) {
            subdirectories.push_back(entry.path());
        } else if (entry.is_regular_file(entry_ec)) {
            files.push_back(entry.path());
        }
    }

    // Prune excluded subdirectories before descending
    std::vector<fs::path> kept_subdirectories;
    size_t pruned = 0;
    for (const auto& subdirectory : subdirectories) {
        if (m_glob_matcher.shouldInclude(subdirectory, true) &&
            m_ignore_matcher.shouldInclude(subdirectory, true)) {
            kept_subdirectories.push_back(subdirectory);
        } else {
            pruned++;
        }
    }
    result.stats.ignored += pruned;

    for (const auto& file : files) {
        visitFile(file, result);
    }

    for (const auto& subdirectory : kept_subdirectories) {
        walkDirectory(subdirectory, result);
    }
}

void FileScanner::visitFile(const fs::path& file_path, ScanResult& result) const {
    result.stats.scanned++;

    if (!m_glob_matcher.shouldInclude(file_path, false)) {
        result.stats.glob_filtered++;
        return;
    }

    if (!m_ignore_matcher.shouldInclude(file_path, false)) {
        result.stats.ignored++;
        return;
    }

    if (m_options.max_file_size) {
        std::error_code ec;
        std::uintmax_t size = fs::file_size(file_path, ec);
        if (!ec && size > *m_options.max_file_size) {
            if (m_options.debug) {
                Logger::getInstance().debug("FileScanner", "Size filtered: " + file_path.string(),
                                            FormatUtils::formatSize(size));
            }
            result.stats.size_filtered++;
            return;
        }
    }

    if (m_options.text_only && !TextFile::isText(file_path)) {
        if (m_options.debug) {
            Logger::getInstance().debug("FileScanner", "Not a text file: " + file_path.string());
        }
        result.stats.non_text++;
        return;
    }

    result.files.push_back(getFileInfo(file_path));
    result.stats.included++;
}

FileRecord FileScanner::getFileInfo(const fs::path& path) {
    FileRecord record;
    record.path = path.string();

    std::error_code ec;
    std::uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        return record;
    }

    if (size > LARGE_FILE_WARNING_SIZE) {
        Logger::getInstance().warning("FileScanner", "Large file detected: " + path.string(),
                                      FormatUtils::formatSize(size) + ", this may consume significant memory");
    }

    try {
        record.line_count = TextFile::countLinesInFile(path);
        record.size = size;
    } catch (const fs::filesystem_error& e) {
        Logger::getInstance().debug("FileScanner", "Cannot read " + path.string(), e.what());
        record.line_count = 0;
        record.size = 0;
    }

    return record;
}

} // namespace Kasu
