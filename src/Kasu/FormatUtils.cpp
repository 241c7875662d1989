// =================================================================
// src/Kasu/FormatUtils.cpp
// =================================================================
// Implementation for size and number formatting.

#include "Kasu/FormatUtils.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <limits>
#include <map>
#include <regex>
#include <stdexcept>

namespace Kasu {

std::string FormatUtils::formatSize(std::uintmax_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB"};

    double size = static_cast<double>(bytes);
    const char* unit = "TB";
    for (const char* candidate : units) {
        if (size < 1024.0) {
            unit = candidate;
            break;
        }
        size /= 1024.0;
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.1f %s", size, unit);
    return buffer;
}

std::uintmax_t FormatUtils::parseSize(const std::string& text) {
    static const std::map<std::string, std::uintmax_t> multipliers = {
        {"B", 1},
        {"K", 1024ULL},
        {"KB", 1024ULL},
        {"M", 1024ULL * 1024},
        {"MB", 1024ULL * 1024},
        {"G", 1024ULL * 1024 * 1024},
        {"GB", 1024ULL * 1024 * 1024},
    };
    static const std::regex size_pattern(R"(^([0-9.]+)\s*([KMGB]+)$)");

    std::string normalized = text;
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    size_t first = normalized.find_first_not_of(" \t\r\n");
    size_t last = normalized.find_last_not_of(" \t\r\n");
    normalized = first == std::string::npos ? "" : normalized.substr(first, last - first + 1);

    std::smatch match;
    if (!std::regex_match(normalized, match, size_pattern)) {
        throw std::invalid_argument("Invalid size format: " + text + ". Use format like '1M', '500K', '1.5G'");
    }

    const std::string number_text = match[1].str();
    const std::string unit = match[2].str();

    auto multiplier = multipliers.find(unit);
    if (multiplier == multipliers.end()) {
        throw std::invalid_argument("Unknown unit: " + unit + ". Use B, K, M, or G");
    }

    size_t consumed = 0;
    double number = 0.0;
    try {
        number = std::stod(number_text, &consumed);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid size format: " + text);
    }
    if (consumed != number_text.size()) {
        throw std::invalid_argument("Invalid size format: " + text);
    }

    const double bytes = number * static_cast<double>(multiplier->second);
    // Must fit in a uintmax_t
    if (!std::isfinite(bytes) ||
        bytes >= std::ldexp(1.0, std::numeric_limits<std::uintmax_t>::digits)) {
        throw std::invalid_argument("Size too large: " + text);
    }

    return static_cast<std::uintmax_t>(bytes);
}

std::string FormatUtils::formatWithCommas(std::uintmax_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);

    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (digits.size() - i) % 3 == 0) {
            result += ',';
        }
        result += digits[i];
    }
    return result;
}

} // namespace Kasu
