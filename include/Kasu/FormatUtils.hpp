// =================================================================
// include/Kasu/FormatUtils.hpp
// =================================================================
// Header for human-readable size and number formatting.

#pragma once

#include <cstdint>
#include <string>

namespace Kasu {

class FormatUtils {
public:
    /**
     * @brief Format a byte count with one decimal and a binary unit
     * @param bytes Byte count
     * @return e.g. "512.0 B", "1.5 MB", "2.0 TB"
     */
    static std::string formatSize(std::uintmax_t bytes);

    /**
     * @brief Parse a size such as "500K", "1.5M" or "2GB"
     *
     * Units are B, K, KB, M, MB, G, GB in any case, with optional
     * whitespace between number and unit. A unit is required.
     *
     * @param text Size string
     * @return Size in bytes, fractions truncated
     * @throws std::invalid_argument if the text is malformed
     */
    static std::uintmax_t parseSize(const std::string& text);

    /**
     * @brief Insert thousands separators
     * @param value Number to format
     * @return e.g. "1,234,567"
     */
    static std::string formatWithCommas(std::uintmax_t value);
};

} // namespace Kasu
