// =================================================================
// src/Kasu/ContentWindow.cpp
// =================================================================
// Implementation for head/tail line windowing.

#include "Kasu/ContentWindow.hpp"
#include <algorithm>

namespace Kasu {

std::string ContentWindow::apply(const std::string& content, const LineWindow& window) {
    if (window.head) {
        std::vector<std::string> lines = splitLines(content);
        size_t kept = std::min(*window.head, lines.size());
        std::string result = joinLines(lines.cbegin(), lines.cbegin() + static_cast<std::ptrdiff_t>(kept));
        if (kept == *window.head && !result.empty()) {
            result += "\n";
            result += TRUNCATION_MARKER;
            result += "\n";
        }
        return result;
    }

    if (window.tail) {
        std::vector<std::string> lines = splitLines(content);
        size_t kept = std::min(*window.tail, lines.size());
        return std::string(TRUNCATION_MARKER) + "\n" +
               joinLines(lines.cend() - static_cast<std::ptrdiff_t>(kept), lines.cend());
    }

    return content;
}

std::vector<std::string> ContentWindow::splitLines(const std::string& content) {
    // A trailing '\n' yields a final empty line
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t newline = content.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, newline - start));
        start = newline + 1;
    }
    return lines;
}

std::string ContentWindow::joinLines(std::vector<std::string>::const_iterator first,
                                     std::vector<std::string>::const_iterator last) {
    std::string joined;
    for (auto it = first; it != last; ++it) {
        if (it != first) {
            joined += '\n';
        }
        joined += *it;
    }
    return joined;
}

} // namespace Kasu
