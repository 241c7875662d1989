// =================================================================
// src/Kasu/Sanitizer.cpp
// =================================================================
// Implementation for redaction of sensitive values.

#include "Kasu/Sanitizer.hpp"
#include "Kasu/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

namespace Kasu {

namespace {

/**
 * @brief An automatic detector
 *
 * Every quantifier in the patterns is bounded, so matching depth never
 * grows with the length of a token. Credential values of arbitrary length
 * are read by extending the match over value_char instead.
 */
struct Detector {
    const char* label;          ///< Category label used in the stats
    const char* tag;            ///< Placeholder tag, [REDACTED_<tag>_n]
    std::regex pattern;
    size_t value_group;         ///< Group holding the redacted value (0 = whole match)
    bool (*accept)(const std::string& value);
    bool (*value_char)(char c); ///< When set, the value is the run of these characters after the match
    size_t min_length;
};

bool acceptAll(const std::string&) {
    return true;
}

bool isPublicAddress(const std::string& ip) {
    static const char* const kept_prefixes[] = {"127.", "0.", "192.168.", "10."};
    for (const char* prefix : kept_prefixes) {
        if (ip.rfind(prefix, 0) == 0) {
            return false;
        }
    }
    return true;
}

bool isApiKeyChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

bool isPasswordChar(char c) {
    return !std::isspace(static_cast<unsigned char>(c)) && c != '"' && c != '\'';
}

const std::vector<Detector>& valueDetectors() {
    static const std::vector<Detector> detectors = {
        {"IP addresses", "IP",
         std::regex(R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)"), 0, isPublicAddress, nullptr, 0},
        {"Email addresses", "EMAIL",
         std::regex(R"(\b[A-Za-z0-9._%+-]{1,64}@[A-Za-z0-9.-]{1,255}\.[A-Za-z]{2,63}\b)"), 0, acceptAll,
         nullptr, 0},
        {"AWS Keys", "AWS_KEY",
         std::regex(R"(\b(AKIA[0-9A-Z]{16})\b)"), 1, acceptAll, nullptr, 0},
        {"API Keys", "API_KEY",
         std::regex(R"((api[_-]?key|apikey|api[_-]?secret)\s{0,32}[=:]["']?)",
                    std::regex_constants::ECMAScript | std::regex_constants::icase), 0, acceptAll,
         isApiKeyChar, 20},
        {"Passwords", "PASSWORD",
         std::regex(R"((password|passwd|pwd)\s{0,32}[=:]["']?)",
                    std::regex_constants::ECMAScript | std::regex_constants::icase), 0, acceptAll,
         isPasswordChar, 6},
    };
    return detectors;
}

/**
 * @brief Distinct accepted values of one detector, in order of first occurrence
 */
std::vector<std::string> collectValues(const Detector& detector, const std::string& content) {
    std::vector<std::string> values;

    auto search_begin = content.cbegin();
    const auto search_end = content.cend();
    std::smatch match;
    while (search_begin != search_end) {
        auto flags = search_begin == content.cbegin() ? std::regex_constants::match_default
                                                      : std::regex_constants::match_prev_avail;
        if (!std::regex_search(search_begin, search_end, match, detector.pattern, flags)) {
            break;
        }

        std::string value;
        auto next = match[0].second;
        if (detector.value_char) {
            auto value_end = std::find_if_not(next, search_end, detector.value_char);
            if (static_cast<size_t>(value_end - next) >= detector.min_length) {
                value.assign(next, value_end);
            }
            next = value_end;
        } else {
            value = match[detector.value_group].str();
        }

        if (!value.empty() && detector.accept(value) &&
            std::find(values.begin(), values.end(), value) == values.end()) {
            values.push_back(value);
        }

        search_begin = (next == search_begin) ? next + 1 : next;
    }

    return values;
}

/**
 * @brief Length of the private key marker of the given kind at pos, 0 if none
 */
size_t privateKeyMarkerLength(const std::string& content, size_t pos, const std::string& kind) {
    static const char* const labels[] = {"PRIVATE KEY-----", "RSA PRIVATE KEY-----"};
    for (const char* label : labels) {
        const std::string marker = "-----" + kind + " " + label;
        if (content.compare(pos, marker.size(), marker) == 0) {
            return marker.size();
        }
    }
    return 0;
}

size_t findPrivateKeyMarker(const std::string& content, size_t from, const std::string& kind,
                            size_t& length) {
    const std::string lead = "-----" + kind + " ";
    for (size_t pos = content.find(lead, from); pos != std::string::npos;
         pos = content.find(lead, pos + 1)) {
        length = privateKeyMarkerLength(content, pos, kind);
        if (length > 0) {
            return pos;
        }
    }
    return std::string::npos;
}

/**
 * @brief Replace every BEGIN..END private key block
 *
 * A BEGIN marker without a later END marker is left as it is.
 */
std::string redactPrivateKeys(const std::string& content, size_t& blocks) {
    std::string output;
    size_t pos = 0;

    while (pos < content.size()) {
        size_t begin_length = 0;
        size_t begin = findPrivateKeyMarker(content, pos, "BEGIN", begin_length);
        if (begin == std::string::npos) {
            break;
        }
        size_t end_length = 0;
        size_t end = findPrivateKeyMarker(content, begin + begin_length, "END", end_length);
        if (end == std::string::npos) {
            break;
        }

        output.append(content, pos, begin - pos);
        output += "[REDACTED_PRIVATE_KEY]";
        pos = end + end_length;
        blocks++;
    }

    output.append(content, pos, std::string::npos);
    return output;
}

std::string trim(const std::string& s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

size_t countOccurrences(const std::string& content, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = content.find(needle); pos != std::string::npos;
         pos = content.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

} // namespace

Sanitizer::Sanitizer(bool auto_sanitize, std::vector<ReplacementRule> rules)
    : m_auto_sanitize(auto_sanitize)
{
    for (auto& rule : rules) {
        if (rule.pattern.empty()) {
            Logger::getInstance().warning("Sanitizer", "Skipping replacement rule with an empty pattern");
            continue;
        }

        CompiledRule compiled{std::move(rule), std::nullopt};
        try {
            compiled.regex = std::regex(compiled.rule.pattern, std::regex_constants::ECMAScript);
        } catch (const std::regex_error& e) {
            Logger::getInstance().warning("Sanitizer",
                "Pattern '" + compiled.rule.pattern + "' is not a valid regex, matching it literally", e.what());
        }
        m_rules.push_back(std::move(compiled));
    }
}

SanitizeResult Sanitizer::sanitize(const std::string& content) const {
    SanitizeResult result;
    result.content = content;

    if (m_auto_sanitize) {
        result.content = applyDetectors(result.content, result.stats);
    }

    if (!m_rules.empty()) {
        result.content = applyCustomRules(result.content, result.stats);
    }

    return result;
}

std::string Sanitizer::applyDetectors(const std::string& content, SanitizeStats& stats) const {
    std::string current = content;

    for (const auto& detector : valueDetectors()) {
        std::vector<std::pair<std::string, std::string>> replacements;
        for (const auto& value : collectValues(detector, current)) {
            std::string placeholder = std::string("[REDACTED_") + detector.tag + "_" +
                                      std::to_string(replacements.size() + 1) + "]";
            replacements.emplace_back(value, placeholder);
        }

        if (!replacements.empty()) {
            current = replaceValues(current, replacements);
            stats[detector.label] += replacements.size();
        }
    }

    // Private key blocks are replaced whole and counted per block
    if (current.find("PRIVATE KEY-----") == std::string::npos) {
        return current;
    }
    size_t blocks = 0;
    current = redactPrivateKeys(current, blocks);
    if (blocks > 0) {
        stats["Private Keys"] += blocks;
    }

    return current;
}

std::string Sanitizer::applyCustomRules(const std::string& content, SanitizeStats& stats) const {
    std::string current = content;

    for (const auto& compiled : m_rules) {
        const std::string label = std::string(CUSTOM_LABEL_PREFIX) + compiled.rule.pattern;

        if (compiled.regex) {
            size_t matches = static_cast<size_t>(std::distance(
                std::sregex_iterator(current.begin(), current.end(), *compiled.regex),
                std::sregex_iterator()));
            if (matches > 0) {
                current = std::regex_replace(current, *compiled.regex, compiled.rule.replacement);
                stats[label] += matches;
            }
        } else {
            size_t occurrences = countOccurrences(current, compiled.rule.pattern);
            if (occurrences > 0) {
                current = replaceValues(current, {{compiled.rule.pattern, compiled.rule.replacement}});
                stats[label] += occurrences;
            }
        }
    }

    return current;
}

std::string Sanitizer::replaceValues(const std::string& content,
                                     const std::vector<std::pair<std::string, std::string>>& replacements) {
    std::vector<const std::pair<std::string, std::string>*> by_length;
    for (const auto& replacement : replacements) {
        by_length.push_back(&replacement);
    }
    std::stable_sort(by_length.begin(), by_length.end(), [](const auto* a, const auto* b) {
        return a->first.size() > b->first.size();
    });

    std::string output;
    output.reserve(content.size());

    size_t pos = 0;
    while (pos < content.size()) {
        const std::pair<std::string, std::string>* hit = nullptr;
        for (const auto* candidate : by_length) {
            if (content.compare(pos, candidate->first.size(), candidate->first) == 0) {
                hit = candidate;
                break;
            }
        }

        if (hit) {
            output += hit->second;
            pos += hit->first.size();
        } else {
            output += content[pos];
            ++pos;
        }
    }

    return output;
}

std::vector<ReplacementRule> Sanitizer::loadReplacementRules(const std::string& file_path) {
    std::vector<ReplacementRule> rules;
    if (file_path.empty()) {
        return rules;
    }

    std::ifstream file(file_path);
    if (!file.is_open()) {
        return rules;
    }

    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        size_t arrow = line.find("->");
        if (arrow != std::string::npos) {
            rules.push_back({trim(line.substr(0, arrow)), trim(line.substr(arrow + 2))});
            continue;
        }

        size_t separator = line.find_first_of(" \t");
        if (separator == std::string::npos) {
            continue;
        }
        size_t value_start = line.find_first_not_of(" \t", separator);
        if (value_start == std::string::npos) {
            continue;
        }
        rules.push_back({line.substr(0, separator), line.substr(value_start)});
    }

    return rules;
}

void Sanitizer::mergeStats(SanitizeStats& total, const SanitizeStats& addition) {
    for (const auto& [label, count] : addition) {
        total[label] += count;
    }
}

} // namespace Kasu
