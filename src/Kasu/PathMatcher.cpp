// =================================================================
// src/Kasu/PathMatcher.cpp
// =================================================================
// Implementation for the include and exclude path filters.

#include "Kasu/PathMatcher.hpp"
#include "Kasu/Errors.hpp"
#include "Kasu/Logger.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace Kasu {

namespace {

fs::path normalizeAbsolute(const fs::path& path) {
    std::error_code ec;
    fs::path normalized = fs::absolute(path, ec);
    normalized = ec ? path.lexically_normal() : normalized.lexically_normal();

    // Drop the empty element a trailing separator leaves behind
    if (!normalized.has_filename() && normalized.has_relative_path()) {
        normalized = normalized.parent_path();
    }
    return normalized;
}

} // namespace

PathMatcher::PathMatcher(const std::string& root_dir, bool debug)
    : m_root(normalizeAbsolute(root_dir)),
      m_debug(debug)
{
}

bool PathMatcher::shouldInclude(const fs::path& path) const {
    std::error_code ec;
    bool is_directory = fs::is_directory(path, ec);
    return shouldInclude(path, is_directory && !ec);
}

std::optional<std::string> PathMatcher::relativePath(const fs::path& path) const {
    return makeRelative(path, m_root);
}

std::optional<std::string> PathMatcher::makeRelative(const fs::path& path, const fs::path& root) {
    fs::path relative = normalizeAbsolute(path).lexically_relative(normalizeAbsolute(root));
    if (relative.empty()) {
        return std::nullopt;
    }
    return relative.generic_string();
}

// GlobMatcher implementation

GlobMatcher::GlobMatcher(const std::string& root_dir, const std::vector<std::string>& patterns, bool debug)
    : PathMatcher(root_dir, debug),
      m_pattern_strings(patterns)
{
    for (const auto& pattern_string : patterns) {
        IgnorePattern pattern(pattern_string);
        if (!pattern.isValid()) {
            throw PatternError("Invalid glob pattern '" + pattern_string + "': " + pattern.getError());
        }
        m_patterns.addCompiledPattern(std::move(pattern));
    }
}

bool GlobMatcher::shouldInclude(const fs::path& path, bool is_directory) const {
    if (!isActive()) {
        return true;
    }

    // Directories are descended so matching files below them can be found
    if (is_directory) {
        return true;
    }

    auto relative = relativePath(path);
    if (!relative) {
        return false;
    }

    if (m_patterns.matchesAny(*relative)) {
        if (m_debug) {
            Logger::getInstance().debug("GlobMatcher", "Matched: " + *relative);
        }
        return true;
    }

    if (m_debug) {
        Logger::getInstance().debug("GlobMatcher", "Not matched: " + *relative);
    }
    return false;
}

// IgnoreMatcher implementation

IgnoreMatcher::IgnoreMatcher(const std::string& root_dir, const std::vector<std::string>& patterns,
                             bool debug, bool auto_vcs_ignore)
    : PathMatcher(root_dir, debug)
{
    if (auto_vcs_ignore) {
        for (const char* vcs_pattern : VCS_IGNORE_PATTERNS) {
            m_patterns.addPattern(vcs_pattern);
        }
        if (m_debug) {
            Logger::getInstance().debug("IgnoreMatcher", "Auto-ignoring VCS files and directories");
        }
    }

    for (const auto& pattern : patterns) {
        m_patterns.addPattern(pattern);
    }
}

bool IgnoreMatcher::shouldInclude(const fs::path& path, bool is_directory) const {
    return !isIgnored(path, is_directory);
}

bool IgnoreMatcher::isIgnored(const fs::path& path, bool is_directory) const {
    auto relative = relativePath(path);
    if (!relative) {
        return true;
    }

    if (m_patterns.matchesAny(*relative)) {
        if (m_debug) {
            Logger::getInstance().debug("IgnoreMatcher", "Ignored: " + *relative);
        }
        return true;
    }

    if (is_directory && m_patterns.matchesAny(*relative + "/")) {
        if (m_debug) {
            Logger::getInstance().debug("IgnoreMatcher", "Ignored directory: " + *relative + "/");
        }
        return true;
    }

    return false;
}

std::optional<std::string> IgnoreMatcher::autoDetectIgnoreFile(const std::string& target_dir) {
    fs::path gitignore = fs::path(target_dir) / ".gitignore";
    std::error_code ec;
    if (fs::exists(gitignore, ec)) {
        return gitignore.string();
    }
    return std::nullopt;
}

std::vector<std::string> IgnoreMatcher::loadPatternsFromFiles(const std::vector<std::string>& file_paths) {
    std::vector<std::string> all_patterns;
    for (const auto& file_path : file_paths) {
        if (file_path.empty()) {
            continue;
        }
        auto patterns = IgnorePatternSet::readPatternFile(file_path);
        all_patterns.insert(all_patterns.end(), patterns.begin(), patterns.end());
    }
    return all_patterns;
}

} // namespace Kasu
