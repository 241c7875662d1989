// =================================================================
// src/Kasu/TreeRenderer.cpp
// =================================================================
// Implementation for the indented directory tree view.

#include "Kasu/TreeRenderer.hpp"
#include "Kasu/TextFile.hpp"
#include <algorithm>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace Kasu {

TreeRenderer::TreeRenderer(const GlobMatcher& glob_matcher, const IgnoreMatcher& ignore_matcher)
    : m_glob_matcher(glob_matcher),
      m_ignore_matcher(ignore_matcher)
{
}

std::string TreeRenderer::render(const std::string& root_dir) const {
    std::vector<std::string> lines;
    lines.push_back(rootLabel(root_dir) + "/");

    walkDirectory(fs::path(root_dir), "", lines);

    std::ostringstream output;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            output << '\n';
        }
        output << lines[i];
    }
    return output.str();
}

std::string TreeRenderer::rootLabel(const std::string& root_dir) {
    std::error_code ec;
    fs::path absolute = fs::absolute(fs::path(root_dir), ec);
    if (ec) {
        absolute = fs::path(root_dir);
    }
    absolute = absolute.lexically_normal();

    // "/a/b/" normalizes to "/a/b/" with an empty filename
    if (!absolute.has_filename() && absolute.has_relative_path()) {
        absolute = absolute.parent_path();
    }

    std::string name = absolute.filename().string();
    if (name.empty()) {
        return root_dir;
    }
    return name;
}

void TreeRenderer::walkDirectory(const fs::path& directory, const std::string& prefix,
                                 std::vector<std::string>& lines) const {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return;
    }

    std::vector<std::string> names;
    const fs::directory_iterator end{};
    for (; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        names.push_back(it->path().filename().string());
    }
    std::sort(names.begin(), names.end());

    std::vector<std::string> directories;
    std::vector<std::string> files;

    for (const auto& name : names) {
        fs::path entry_path = directory / name;

        std::error_code status_ec;
        fs::file_status status = fs::symlink_status(entry_path, status_ec);
        if (status_ec || fs::is_symlink(status)) {
            continue;
        }

        bool is_directory = fs::is_directory(status);
        if (!m_ignore_matcher.shouldInclude(entry_path, is_directory)) {
            continue;
        }

        if (is_directory) {
            directories.push_back(name);
        } else if (fs::is_regular_file(status)) {
            if (m_glob_matcher.shouldInclude(entry_path, false) && TextFile::isText(entry_path)) {
                files.push_back(name);
            }
        }
    }

    const size_t total = directories.size() + files.size();
    for (size_t i = 0; i < total; ++i) {
        const bool is_last = (i == total - 1);
        const bool is_directory = i < directories.size();
        const std::string& name = is_directory ? directories[i] : files[i - directories.size()];

        lines.push_back(prefix + (is_last ? LAST_BRANCH : BRANCH) + name + (is_directory ? "/" : ""));

        if (is_directory) {
            walkDirectory(directory / name, prefix + (is_last ? SPACE : VERTICAL), lines);
        }
    }
}

} // namespace Kasu
