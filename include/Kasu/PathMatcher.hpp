// =================================================================
// include/Kasu/PathMatcher.hpp
// =================================================================
// Header for the include (glob) and exclude (ignore) path filters.

#pragma once

#include "IgnorePattern.hpp"
#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Kasu {

/**
 * @brief Version-control housekeeping entries excluded when auto-ignore is active
 */
inline constexpr std::array<const char*, 7> VCS_IGNORE_PATTERNS = {
    ".git/",
    ".svn/",
    ".hg/",
    ".bzr/",
    ".gitignore",
    ".gitattributes",
    ".gitmodules"
};

/**
 * @brief The two matcher roles; they differ in how directories are treated
 */
enum class MatcherRole {
    Include,    ///< Glob patterns: a file must match one of them
    Exclude     ///< Ignore patterns: a matching path is dropped
};

/**
 * @brief Decides whether a path under a root directory takes part in a run
 *
 * Paths are made root-relative and slash-normalized before matching.
 * A path that cannot be expressed relative to the root is always rejected.
 */
class PathMatcher {
public:
    virtual ~PathMatcher() = default;

    /**
     * @brief Check a path whose kind is already known
     * @param path Absolute or root-prefixed path
     * @param is_directory True if path names a directory
     * @return true if the path should be kept
     */
    virtual bool shouldInclude(const std::filesystem::path& path, bool is_directory) const = 0;

    /**
     * @brief Check a path, querying the filesystem for its kind
     * @param path Absolute or root-prefixed path
     * @return true if the path should be kept
     */
    bool shouldInclude(const std::filesystem::path& path) const;

    virtual MatcherRole role() const = 0;

    /**
     * @brief Check whether the matcher has any patterns
     */
    virtual bool isActive() const = 0;

    const std::filesystem::path& getRoot() const { return m_root; }

    /**
     * @brief Convert a path to its root-relative, forward-slash form
     * @param path Path to convert
     * @return Relative path, or nullopt if it has no relative form
     */
    std::optional<std::string> relativePath(const std::filesystem::path& path) const;

    /**
     * @brief Express a path relative to an arbitrary root
     * @param path Path to convert
     * @param root Directory the result is relative to
     * @return Forward-slash relative path, or nullopt if there is none
     */
    static std::optional<std::string> makeRelative(const std::filesystem::path& path,
                                                   const std::filesystem::path& root);

protected:
    PathMatcher(const std::string& root_dir, bool debug);

    std::filesystem::path m_root;
    bool m_debug;
};

/**
 * @brief Include matcher built from glob patterns
 *
 * With no patterns every path matches. Directories always match so the
 * traversal can look for matching files below them.
 */
class GlobMatcher final : public PathMatcher {
public:
    /**
     * @brief Compile the include patterns
     * @param root_dir Root the patterns are relative to
     * @param patterns Glob patterns (gitignore wildmatch syntax)
     * @param debug Emit a trace line per decision
     * @throws PatternError if any pattern is malformed
     */
    GlobMatcher(const std::string& root_dir, const std::vector<std::string>& patterns, bool debug = false);

    using PathMatcher::shouldInclude;
    bool shouldInclude(const std::filesystem::path& path, bool is_directory) const override;

    MatcherRole role() const override { return MatcherRole::Include; }

    bool isActive() const override { return !m_patterns.empty(); }

    const std::vector<std::string>& getPatterns() const { return m_pattern_strings; }

private:
    IgnorePatternSet m_patterns;
    std::vector<std::string> m_pattern_strings;
};

/**
 * @brief Exclude matcher built from ignore-file and command-line patterns
 *
 * Malformed entries are skipped with a warning. Directories are tested
 * both as-is and with a trailing slash so directory-only patterns apply.
 */
class IgnoreMatcher final : public PathMatcher {
public:
    /**
     * @brief Compile the exclude patterns
     * @param root_dir Root the patterns are relative to
     * @param patterns Ignore patterns in priority order
     * @param debug Emit a trace line per ignored path
     * @param auto_vcs_ignore Prepend VCS_IGNORE_PATTERNS
     */
    IgnoreMatcher(const std::string& root_dir, const std::vector<std::string>& patterns,
                  bool debug = false, bool auto_vcs_ignore = false);

    using PathMatcher::shouldInclude;
    bool shouldInclude(const std::filesystem::path& path, bool is_directory) const override;

    MatcherRole role() const override { return MatcherRole::Exclude; }

    bool isActive() const override { return !m_patterns.empty(); }

    /**
     * @brief Check whether a path is ignored
     * @param path Path to test
     * @param is_directory True if path names a directory
     * @return true if the path is excluded
     */
    bool isIgnored(const std::filesystem::path& path, bool is_directory) const;

    size_t patternCount() const { return m_patterns.size(); }

    /**
     * @brief Locate the ignore file that is used when none is given
     * @param target_dir Directory being merged
     * @return Path of <target_dir>/.gitignore, or nullopt if absent
     */
    static std::optional<std::string> autoDetectIgnoreFile(const std::string& target_dir);

    /**
     * @brief Read and concatenate the patterns of several ignore files
     * @param file_paths Ignore files in priority order
     * @return Patterns in file order
     */
    static std::vector<std::string> loadPatternsFromFiles(const std::vector<std::string>& file_paths);

private:
    IgnorePatternSet m_patterns;
};

} // namespace Kasu
