// =================================================================
// include/Kasu/ContentWindow.hpp
// =================================================================
// Header for head/tail line windowing of file content.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Kasu {

/**
 * @brief Line limit applied to every file body
 *
 * head and tail are mutually exclusive; the run parameters are validated
 * before a window is built. When both are set, head takes precedence.
 */
struct LineWindow {
    std::optional<size_t> head;
    std::optional<size_t> tail;

    bool isActive() const { return head.has_value() || tail.has_value(); }
};

/**
 * @brief Truncates content to its first or last lines
 */
class ContentWindow {
public:
    /**
     * @brief Apply a line window
     *
     * Lines are split on '\n'. Head mode keeps the first N lines and appends
     * a marker line only when exactly N lines were kept and the result is
     * not empty. Tail mode keeps the last N lines and always prepends the
     * marker line.
     *
     * @param content Full file text
     * @param window Limit to apply
     * @return Windowed text, or content unchanged when the window is inactive
     */
    static std::string apply(const std::string& content, const LineWindow& window);

    static constexpr const char* TRUNCATION_MARKER = "... (truncated)";

private:
    static std::vector<std::string> splitLines(const std::string& content);

    static std::string joinLines(std::vector<std::string>::const_iterator first,
                                 std::vector<std::string>::const_iterator last);
};

} // namespace Kasu
