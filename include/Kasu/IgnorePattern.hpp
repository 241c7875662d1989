// =================================================================
// include/Kasu/IgnorePattern.hpp
// =================================================================
// Header for gitignore-compatible (wildmatch) pattern matching.

#pragma once

#include <string>
#include <vector>
#include <regex>

namespace Kasu {

/**
 * @brief A single gitignore-style pattern compiled to a regular expression
 *
 * Supports the gitignore pattern syntax:
 * - Wildcards: *, **, ?
 * - Bracket classes: [abc], [a-z], [!abc]
 * - Negation: !pattern
 * - Directory-only patterns: pattern/
 * - Anchored patterns: /pattern, or any pattern with an inner slash
 * - Comment lines: # comment
 *
 * Paths handed to matches() are root-relative and use forward slashes.
 * A pattern that matches a directory also matches everything below it.
 */
class IgnorePattern {
public:
    /**
     * @brief Construct a pattern matcher from a gitignore-style pattern
     * @param pattern The pattern string
     */
    explicit IgnorePattern(const std::string& pattern);

    /**
     * @brief Check if a path matches this pattern
     *
     * Directory-only patterns match a directory when it is given with a
     * trailing slash ("build/") and match every path below it.
     *
     * @param path Relative, slash-normalized path from the root
     * @return true if path matches the pattern
     */
    bool matches(const std::string& path) const;

    /**
     * @brief Check if this is a negation pattern (starts with !)
     */
    bool isNegation() const { return m_is_negation; }

    /**
     * @brief Check if this pattern only matches directories
     */
    bool isDirectoryOnly() const { return m_directory_only; }

    /**
     * @brief Check if the pattern is anchored to the root
     */
    bool isAnchored() const { return m_is_anchored; }

    /**
     * @brief Get the original pattern string
     */
    const std::string& getPattern() const { return m_original_pattern; }

    /**
     * @brief Check if pattern is empty or a comment
     */
    bool isEmpty() const { return m_is_empty; }

    /**
     * @brief Check if the pattern compiled successfully
     */
    bool isValid() const { return m_error.empty(); }

    /**
     * @brief Describe why compilation failed
     * @return Empty string for valid patterns
     */
    const std::string& getError() const { return m_error; }

    /**
     * @brief Get the regular expression the pattern was translated into
     */
    const std::string& getRegexSource() const { return m_regex_source; }

private:
    std::string m_original_pattern;
    std::string m_regex_source;
    std::string m_error;
    bool m_is_negation;
    bool m_directory_only;
    bool m_is_anchored;
    bool m_is_empty;
    std::regex m_regex;

    /**
     * @brief Process the raw pattern into internal representation
     * @param pattern Raw pattern string
     */
    void processPattern(const std::string& pattern);

    /**
     * @brief Convert slash-separated pattern segments to a regex
     * @param segments Pattern split on '/'
     * @return Equivalent regex source, anchored at both ends
     */
    std::string segmentsToRegex(const std::vector<std::string>& segments);

    /**
     * @brief Convert one path segment glob to regex
     * @param segment Segment text without slashes
     * @return Regex fragment; sets m_error on malformed input
     */
    std::string translateSegment(const std::string& segment);
};

/**
 * @brief Ordered collection of ignore patterns
 *
 * Patterns are evaluated in order and the last matching pattern decides,
 * so a later negation ("!keep.log") re-includes what an earlier pattern
 * excluded.
 */
class IgnorePatternSet {
public:
    /**
     * @brief Compile and add a pattern to the set
     *
     * Malformed patterns are reported as a warning and never match.
     *
     * @param pattern Pattern string
     * @return true if the pattern was added
     */
    bool addPattern(const std::string& pattern);

    /**
     * @brief Add an already compiled, valid pattern
     * @param pattern Compiled pattern
     */
    void addCompiledPattern(IgnorePattern pattern);

    /**
     * @brief Load patterns from an ignore file (e.g., .gitignore)
     * @param file_path Path to ignore file
     * @return Number of patterns loaded
     */
    size_t loadFromFile(const std::string& file_path);

    /**
     * @brief Read the raw pattern lines of an ignore file
     *
     * Blank lines and lines starting with '#' are skipped, every other line
     * is trimmed and returned verbatim.
     *
     * @param file_path Path to ignore file
     * @return Pattern strings in file order; empty if the file is unreadable
     */
    static std::vector<std::string> readPatternFile(const std::string& file_path);

    /**
     * @brief Check if a path should be ignored
     * @param path Relative path from the root
     * @param is_directory True if path is a directory; it is then also tested with a trailing slash
     * @return true if path should be ignored
     */
    bool shouldIgnore(const std::string& path, bool is_directory = false) const;

    /**
     * @brief Check if any pattern of the set matches the path
     * @param path Relative path from the root
     * @return true if the last matching pattern is not a negation
     */
    bool matchesAny(const std::string& path) const;

    size_t size() const { return m_patterns.size(); }

    bool empty() const { return m_patterns.empty(); }

    void clear() { m_patterns.clear(); }

private:
    std::vector<IgnorePattern> m_patterns;
};

} // namespace Kasu
