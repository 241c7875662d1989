// =================================================================
// src/Kasu/Statistics.cpp
// =================================================================
// Implementation for aggregate file statistics.

#include "Kasu/Statistics.hpp"
#include "Kasu/FormatUtils.hpp"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace Kasu {

StatisticsSummary Statistics::calculate(const std::vector<FileRecord>& records) {
    StatisticsSummary summary;
    std::unordered_map<std::string, size_t> index;

    for (const auto& record : records) {
        summary.total_files++;
        summary.total_lines += record.line_count;
        summary.total_size += record.size;

        std::string extension = std::filesystem::path(record.path).extension().string();
        if (extension.empty()) {
            extension = NO_EXTENSION;
        }

        auto it = index.find(extension);
        if (it == index.end()) {
            it = index.emplace(extension, summary.by_extension.size()).first;
            ExtensionStats stats;
            stats.extension = extension;
            summary.by_extension.push_back(stats);
        }

        ExtensionStats& stats = summary.by_extension[it->second];
        stats.count++;
        stats.lines += record.line_count;
        stats.size += record.size;
    }

    std::stable_sort(summary.by_extension.begin(), summary.by_extension.end(),
                     [](const ExtensionStats& a, const ExtensionStats& b) {
                         return a.count > b.count;
                     });
    return summary;
}

void Statistics::printStatistics(const StatisticsSummary& summary, std::ostream& out) {
    const std::string rule(50, '=');

    out << "\n" << rule << "\n";
    out << "Statistics\n";
    out << rule << "\n";
    out << "Total files:  " << FormatUtils::formatWithCommas(summary.total_files) << "\n";
    out << "Total lines:  " << FormatUtils::formatWithCommas(summary.total_lines) << "\n";
    out << "Total size:   " << FormatUtils::formatSize(summary.total_size) << "\n";

    if (!summary.by_extension.empty()) {
        out << "\nBy extension:\n";
        for (const auto& stats : summary.by_extension) {
            out << formatExtensionLine(stats) << "\n";
        }
    }
    out << rule << "\n\n";
}

std::string Statistics::formatExtensionLine(const ExtensionStats& stats) {
    std::ostringstream line;
    line << "  " << std::left << std::setw(15) << stats.extension << std::right
         << " " << std::setw(4) << stats.count << " files  "
         << std::setw(6) << FormatUtils::formatWithCommas(stats.lines) << " lines  "
         << std::setw(10) << FormatUtils::formatSize(stats.size);
    return line.str();
}

} // namespace Kasu
