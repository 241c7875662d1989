// =================================================================
// include/Kasu/Sanitizer.hpp
// =================================================================
// Header for redaction of sensitive values in merged content.

#pragma once

#include <map>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace Kasu {

/**
 * @brief One user-supplied substitution
 *
 * The pattern is used as an ECMAScript regular expression when it compiles
 * and as a literal substring otherwise. For regular expressions the
 * replacement may refer to groups with $1, $2, ...
 */
struct ReplacementRule {
    std::string pattern;
    std::string replacement;
};

/**
 * @brief Number of redactions per category label
 */
using SanitizeStats = std::map<std::string, size_t>;

struct SanitizeResult {
    std::string content;
    SanitizeStats stats;
};

/**
 * @brief Replaces sensitive values with numbered placeholders
 *
 * Automatic detectors run first, in a fixed order, each on the output of the
 * previous one:
 * - "IP addresses"     -> [REDACTED_IP_n]  (127.*, 0.*, 10.* and 192.168.* are kept)
 * - "Email addresses"  -> [REDACTED_EMAIL_n]
 * - "AWS Keys"         -> [REDACTED_AWS_KEY_n]
 * - "API Keys"         -> [REDACTED_API_KEY_n]  (value of an api_key/api_secret assignment)
 * - "Passwords"        -> [REDACTED_PASSWORD_n] (value of a password/passwd/pwd assignment)
 * - "Private Keys"     -> [REDACTED_PRIVATE_KEY] (whole PEM block)
 *
 * Within a detector, n numbers the distinct values in order of first
 * occurrence and every occurrence of a value gets the same placeholder.
 * Custom rules run afterwards in file order, counted under "Custom: <pattern>".
 */
class Sanitizer {
public:
    /**
     * @brief Construct a sanitizer
     * @param auto_sanitize Enable the automatic detectors
     * @param rules Custom rules in application order
     */
    explicit Sanitizer(bool auto_sanitize = false, std::vector<ReplacementRule> rules = {});

    /**
     * @brief Redact one piece of content
     * @param content Text to redact
     * @return Redacted text and the counts of this call
     */
    SanitizeResult sanitize(const std::string& content) const;

    /**
     * @brief Check whether sanitize() can change anything
     */
    bool isEnabled() const { return m_auto_sanitize || !m_rules.empty(); }

    /**
     * @brief Load custom rules from a replacement file
     *
     * Lines are trimmed; blank lines and lines starting with '#' are skipped.
     * "pattern -> replacement" splits at the first arrow, any other line
     * splits at the first run of whitespace. Lines without a replacement
     * are skipped.
     *
     * @param file_path Replacement file
     * @return Rules in file order; empty if the file cannot be read
     */
    static std::vector<ReplacementRule> loadReplacementRules(const std::string& file_path);

    /**
     * @brief Add the counts of one result to a running total
     * @param total Accumulator
     * @param addition Counts to add
     */
    static void mergeStats(SanitizeStats& total, const SanitizeStats& addition);

    static constexpr const char* CUSTOM_LABEL_PREFIX = "Custom: ";

private:
    struct CompiledRule {
        ReplacementRule rule;
        std::optional<std::regex> regex;    ///< Empty when the pattern is used literally
    };

    bool m_auto_sanitize;
    std::vector<CompiledRule> m_rules;

    std::string applyDetectors(const std::string& content, SanitizeStats& stats) const;

    std::string applyCustomRules(const std::string& content, SanitizeStats& stats) const;

    /**
     * @brief Replace each listed value with its placeholder in one left-to-right pass
     *
     * At every position the longest listed value wins, so no placeholder is
     * ever rescanned and a value never clobbers a longer one containing it.
     */
    static std::string replaceValues(const std::string& content,
                                     const std::vector<std::pair<std::string, std::string>>& replacements);
};

} // namespace Kasu
