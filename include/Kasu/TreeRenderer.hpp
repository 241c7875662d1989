// =================================================================
// include/Kasu/TreeRenderer.hpp
// =================================================================
// Header for the indented directory tree view.

#pragma once

#include "PathMatcher.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace Kasu {

/**
 * @brief Renders the filtered directory hierarchy with box-drawing connectors
 *
 * The tree is derived from its own walk, not from a scan result. Every entry
 * is first tested against the exclude matcher; files must additionally pass
 * the include matcher and the text probe, so binary files never appear here
 * even when the flat scan keeps them. Symbolic links are skipped.
 *
 * Example for a root named "project":
 * @code
 * project/
 * ├── src/
 * │   └── main.cpp
 * └── README.md
 * @endcode
 */
class TreeRenderer {
public:
    /**
     * @brief Construct a renderer over two matchers
     * @param glob_matcher Include matcher; must outlive the renderer
     * @param ignore_matcher Exclude matcher; must outlive the renderer
     */
    TreeRenderer(const GlobMatcher& glob_matcher, const IgnoreMatcher& ignore_matcher);

    /**
     * @brief Render the tree rooted at a directory
     * @param root_dir Directory to render
     * @return Lines joined by '\n', without a trailing newline
     */
    std::string render(const std::string& root_dir) const;

    /**
     * @brief Name shown on the first line of the tree
     * @param root_dir Directory as given on the command line
     * @return Last component of the absolute path, or root_dir itself for a filesystem root
     */
    static std::string rootLabel(const std::string& root_dir);

    static constexpr const char* BRANCH = "├── ";
    static constexpr const char* LAST_BRANCH = "└── ";
    static constexpr const char* VERTICAL = "│   ";
    static constexpr const char* SPACE = "    ";

private:
    const GlobMatcher& m_glob_matcher;
    const IgnoreMatcher& m_ignore_matcher;

    void walkDirectory(const std::filesystem::path& directory, const std::string& prefix,
                       std::vector<std::string>& lines) const;
};

} // namespace Kasu
