// =================================================================
// src/Kasu/IgnorePattern.cpp
// =================================================================
// Implementation for gitignore-compatible pattern matching.

#include "Kasu/IgnorePattern.hpp"
#include "Kasu/Logger.hpp"
#include <fstream>
#include <algorithm>

namespace Kasu {

namespace {

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string escapeRegexChar(char c) {
    static const std::string special = ".^$|()[]{}+*?\\";
    if (special.find(c) != std::string::npos) {
        return std::string("\\") + c;
    }
    return std::string(1, c);
}

} // namespace

IgnorePattern::IgnorePattern(const std::string& pattern)
    : m_original_pattern(pattern),
      m_is_negation(false),
      m_directory_only(false),
      m_is_anchored(false),
      m_is_empty(false)
{
    processPattern(pattern);
}

bool IgnorePattern::matches(const std::string& path) const {
    if (m_is_empty || !isValid()) {
        return false;
    }
    return std::regex_match(path, m_regex);
}

void IgnorePattern::processPattern(const std::string& pattern) {
    std::string working_pattern = trim(pattern);

    // Skip empty lines and comments
    if (working_pattern.empty() || working_pattern[0] == '#') {
        m_is_empty = true;
        return;
    }

    // Handle negation patterns
    if (working_pattern[0] == '!') {
        m_is_negation = true;
        working_pattern = working_pattern.substr(1);
    } else if (working_pattern.size() > 1 && working_pattern[0] == '\\' &&
               (working_pattern[1] == '!' || working_pattern[1] == '#')) {
        working_pattern = working_pattern.substr(1);
    }

    // An odd run of trailing backslashes escapes nothing
    size_t trailing_backslashes = 0;
    for (auto it = working_pattern.rbegin(); it != working_pattern.rend() && *it == '\\'; ++it) {
        trailing_backslashes++;
    }
    if (trailing_backslashes % 2 == 1) {
        m_error = "pattern ends with an unescaped backslash";
        return;
    }

    // "/" alone matches nothing
    if (working_pattern.empty() || working_pattern == "/") {
        m_is_empty = true;
        return;
    }

    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t slash = working_pattern.find('/', start);
        if (slash == std::string::npos) {
            segments.push_back(working_pattern.substr(start));
            break;
        }
        segments.push_back(working_pattern.substr(start, slash - start));
        start = slash + 1;
    }

    if (segments.front().empty()) {
        // Leading slash anchors the pattern to the root
        m_is_anchored = true;
        segments.erase(segments.begin());
    } else if (segments.size() == 1 || (segments.size() == 2 && segments[1].empty())) {
        // A bare name matches at any depth
        segments.insert(segments.begin(), "**");
    } else {
        // An inner slash anchors the pattern as well
        m_is_anchored = true;
    }

    if (segments.size() > 1 && segments.back().empty()) {
        // Trailing slash: the directory and everything beneath it
        m_directory_only = true;
        segments.back() = "**";
    }

    // Drop empty inner segments ("a//b") and collapse repeated "**"
    std::vector<std::string> normalized;
    for (const auto& segment : segments) {
        if (segment.empty()) {
            continue;
        }
        if (segment == "**" && !normalized.empty() && normalized.back() == "**") {
            continue;
        }
        normalized.push_back(segment);
    }

    if (normalized.empty()) {
        m_is_empty = true;
        return;
    }

    std::string regex_source = segmentsToRegex(normalized);
    if (!m_error.empty()) {
        return;
    }
    m_regex_source = regex_source;

    try {
        m_regex = std::regex(m_regex_source, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        m_error = e.what();
    }
}

std::string IgnorePattern::segmentsToRegex(const std::vector<std::string>& segments) {
    std::string output = "^";
    bool need_slash = false;
    const size_t end = segments.size() - 1;

    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& segment = segments[i];

        if (segment == "**") {
            if (i == 0 && i == end) {
                output += "[^/]+(?:/.*)?";
            } else if (i == 0) {
                // Leading "**/" matches any number of leading directories
                output += "(?:.+/)?";
                need_slash = false;
            } else if (i == end) {
                // Trailing "/**" matches everything inside
                output += "/.*";
            } else {
                // Inner "/**/" matches zero or more directories
                output += "(?:/.+)?";
                need_slash = true;
            }
        } else if (segment == "*") {
            if (need_slash) {
                output += "/";
            }
            output += "[^/]+";
            if (i == end) {
                output += "(?:/.*)?";
            }
            need_slash = true;
        } else {
            if (need_slash) {
                output += "/";
            }
            output += translateSegment(segment);
            if (!m_error.empty()) {
                return "";
            }
            if (i == end) {
                output += "(?:/.*)?";
            }
            need_slash = true;
        }
    }

    output += "$";
    return output;
}

std::string IgnorePattern::translateSegment(const std::string& segment) {
    std::string regex_pattern;
    const size_t length = segment.length();

    for (size_t i = 0; i < length; ++i) {
        char c = segment[i];

        switch (c) {
            case '*':
                // Collapse runs of '*' inside a segment
                while (i + 1 < length && segment[i + 1] == '*') {
                    ++i;
                }
                regex_pattern += "[^/]*";
                break;

            case '?':
                regex_pattern += "[^/]";
                break;

            case '\\':
                if (i + 1 < length) {
                    regex_pattern += escapeRegexChar(segment[++i]);
                }
                break;

            case '[': {
                size_t j = i + 1;
                bool negated = false;
                if (j < length && (segment[j] == '!' || segment[j] == '^')) {
                    negated = true;
                    ++j;
                }
                // A leading ']' is part of the class
                if (j < length && segment[j] == ']') {
                    ++j;
                }
                while (j < length && segment[j] != ']') {
                    if (segment[j] == '\\') {
                        ++j;
                    } else if (segment[j] == '[' && j + 1 < length && segment[j + 1] == ':') {
                        size_t close = segment.find(":]", j + 2);
                        if (close != std::string::npos) {
                            j = close + 1;
                        }
                    }
                    ++j;
                }
                if (j >= length) {
                    m_error = "unterminated bracket expression in '" + segment + "'";
                    return "";
                }

                std::string contents = segment.substr(i + 1 + (negated ? 1 : 0),
                                                      j - i - 1 - (negated ? 1 : 0));
                std::string bracket = negated ? "[^/" : "[";
                for (size_t k = 0; k < contents.size(); ++k) {
                    char bc = contents[k];
                    if (bc == '\\' && k + 1 < contents.size()) {
                        bracket += '\\';
                        bracket += contents[++k];
                    } else if (bc == '[' && k + 1 < contents.size() && contents[k + 1] == ':') {
                        size_t close = contents.find(":]", k + 2);
                        if (close == std::string::npos) {
                            bracket += "\\[";
                        } else {
                            bracket += contents.substr(k, close + 2 - k);
                            k = close + 1;
                        }
                    } else if (bc == '[' || bc == ']' || bc == '\\') {
                        bracket += '\\';
                        bracket += bc;
                    } else if (bc == '^' && k == 0) {
                        bracket += "\\^";
                    } else {
                        bracket += bc;
                    }
                }
                bracket += ']';
                regex_pattern += bracket;
                i = j;
                break;
            }

            default:
                regex_pattern += escapeRegexChar(c);
                break;
        }
    }

    return regex_pattern;
}

// IgnorePatternSet implementation

bool IgnorePatternSet::addPattern(const std::string& pattern) {
    IgnorePattern ignore_pattern(pattern);
    if (ignore_pattern.isEmpty()) {
        return false;
    }
    if (!ignore_pattern.isValid()) {
        Logger::getInstance().warning("IgnorePattern",
            "Skipping malformed pattern '" + pattern + "'", ignore_pattern.getError());
        return false;
    }
    m_patterns.push_back(std::move(ignore_pattern));
    return true;
}

void IgnorePatternSet::addCompiledPattern(IgnorePattern pattern) {
    if (!pattern.isEmpty() && pattern.isValid()) {
        m_patterns.push_back(std::move(pattern));
    }
}

size_t IgnorePatternSet::loadFromFile(const std::string& file_path) {
    size_t patterns_loaded = 0;
    for (const auto& line : readPatternFile(file_path)) {
        if (addPattern(line)) {
            patterns_loaded++;
        }
    }
    return patterns_loaded;
}

std::vector<std::string> IgnorePatternSet::readPatternFile(const std::string& file_path) {
    std::vector<std::string> patterns;
    std::ifstream file(file_path);
    if (!file.is_open()) {
        return patterns;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        patterns.push_back(line);
    }

    return patterns;
}

bool IgnorePatternSet::matchesAny(const std::string& path) const {
    bool matched = false;

    // Later patterns override earlier ones
    for (const auto& pattern : m_patterns) {
        if (pattern.matches(path)) {
            matched = !pattern.isNegation();
        }
    }

    return matched;
}

bool IgnorePatternSet::shouldIgnore(const std::string& path, bool is_directory) const {
    if (matchesAny(path)) {
        return true;
    }
    return is_directory && matchesAny(path + "/");
}

} // namespace Kasu
