// =================================================================
// include/Kasu/Statistics.hpp
// =================================================================
// Header for aggregate statistics over the merged files.

#pragma once

#include "FileScanner.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace Kasu {

/**
 * @brief Totals for one file extension
 */
struct ExtensionStats {
    std::string extension;      ///< ".cpp", or "(no extension)"
    size_t count = 0;
    size_t lines = 0;
    std::uintmax_t size = 0;
};

/**
 * @brief Totals over a list of file records
 */
struct StatisticsSummary {
    size_t total_files = 0;
    size_t total_lines = 0;
    std::uintmax_t total_size = 0;
    std::vector<ExtensionStats> by_extension;   ///< Descending file count, ties in first-seen order
};

class Statistics {
public:
    /**
     * @brief Aggregate the records of a scan
     * @param records Accepted files
     * @return Totals and the per-extension breakdown
     */
    static StatisticsSummary calculate(const std::vector<FileRecord>& records);

    /**
     * @brief Print the console statistics report
     * @param summary Totals to print
     * @param out Destination stream
     */
    static void printStatistics(const StatisticsSummary& summary, std::ostream& out);

    /**
     * @brief Format one breakdown row as "  <ext> <count> files  <lines> lines  <size>"
     * @param stats Row to format
     * @return Padded row without newline
     */
    static std::string formatExtensionLine(const ExtensionStats& stats);

    static constexpr const char* NO_EXTENSION = "(no extension)";
};

} // namespace Kasu
