// =================================================================
// include/Kasu/FileScanner.hpp
// =================================================================
// Header for the filtered directory walk producing file records.

#pragma once

#include "PathMatcher.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Kasu {

/**
 * @brief One accepted file of a scan
 */
struct FileRecord {
    std::string path;           ///< Root-prefixed path as produced by the walk
    std::uintmax_t size = 0;    ///< Bytes on disk
    size_t line_count = 0;
};

/**
 * @brief Filter counters of a single traversal
 */
struct ScanStatistics {
    size_t scanned = 0;         ///< Plain files visited
    size_t glob_filtered = 0;   ///< Files rejected by the include matcher
    size_t ignored = 0;         ///< Files rejected by the exclude matcher, plus pruned directories
    size_t included = 0;
    size_t size_filtered = 0;   ///< Files above the size limit
    size_t non_text = 0;        ///< Files failing the text probe
};

struct ScanResult {
    std::vector<FileRecord> files;
    ScanStatistics stats;
};

/**
 * @brief Optional filters applied after include and exclude matching
 */
struct ScanOptions {
    std::optional<std::uintmax_t> max_file_size;
    bool text_only = false;
    bool debug = false;
};

/**
 * @brief Walks a directory tree once and collects the files that pass all filters
 *
 * Symbolic links are never followed nor reported. Subdirectories rejected by
 * the exclude matcher are pruned before descent. Directories that cannot be
 * listed are skipped silently.
 *
 * Records appear in walk order: the files of a directory first, then the
 * contents of its subdirectories, each in the order the filesystem lists them.
 */
class FileScanner {
public:
    /**
     * @brief Construct a scanner over two matchers
     * @param glob_matcher Include matcher; must outlive the scanner
     * @param ignore_matcher Exclude matcher; must outlive the scanner
     * @param options Additional filters
     */
    FileScanner(const GlobMatcher& glob_matcher, const IgnoreMatcher& ignore_matcher,
                ScanOptions options = {});

    /**
     * @brief Scan a directory tree
     * @param root_dir Directory to walk
     * @return Accepted records and fresh filter counters
     */
    ScanResult scan(const std::string& root_dir) const;

    /**
     * @brief Collect size and line count of a file
     *
     * Any failure to stat or read the file yields size 0 and line count 0.
     *
     * @param path File to inspect
     * @return Record for the file
     */
    static FileRecord getFileInfo(const std::filesystem::path& path);

    static constexpr std::uintmax_t LARGE_FILE_WARNING_SIZE = 100ULL * 1024 * 1024;

private:
    const GlobMatcher& m_glob_matcher;
    const IgnoreMatcher& m_ignore_matcher;
    ScanOptions m_options;

    void walkDirectory(const std::filesystem::path& directory, ScanResult& result) const;

    void visitFile(const std::filesystem::path& file_path, ScanResult& result) const;
};

} // namespace Kasu
