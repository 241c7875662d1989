// =================================================================
// src/Kasu/Merger.cpp
// =================================================================
// Implementation for the merge run state machine.

#include "Kasu/Merger.hpp"
#include "Kasu/Errors.hpp"
#include "Kasu/FileListBuilder.hpp"
#include "Kasu/Logger.hpp"
#include "Kasu/Statistics.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>

namespace Kasu {

std::string mergePhaseName(MergePhase phase) {
    switch (phase) {
        case MergePhase::Idle: return "Idle";
        case MergePhase::Scanning: return "Scanning";
        case MergePhase::RenderingViews: return "RenderingViews";
        case MergePhase::Confirming: return "Confirming";
        case MergePhase::Merging: return "Merging";
        case MergePhase::Writing: return "Writing";
        case MergePhase::Done: return "Done";
        case MergePhase::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

Merger::Merger(const FileScanner& scanner,
               const ContentGenerator& generator,
               const Sanitizer& sanitizer,
               const TreeRenderer& tree_renderer,
               std::ostream& out,
               std::ostream& err,
               std::istream& in)
    : m_scanner(scanner),
      m_generator(generator),
      m_sanitizer(sanitizer),
      m_tree_renderer(tree_renderer),
      m_out(out),
      m_err(err),
      m_in(in),
      m_phase(MergePhase::Idle)
{
}

bool Merger::isDisplayOnly(const MergeOptions& options) {
    return (options.show_tree || options.show_list || options.show_stats) &&
           options.output_file.empty() && !options.to_stdout;
}

MergeReport Merger::merge(const MergeOptions& options) {
    MergeReport report;
    m_phase = MergePhase::Idle;

    const bool display_only = isDisplayOnly(options);
    std::ostream& progress = options.to_stdout ? m_err : m_out;

    transition(MergePhase::Scanning);
    progress << "Scanning files..." << std::endl;

    ScanResult scan = m_scanner.scan(options.target_dir);
    report.scan_stats = scan.stats;

    progress << "Found " << scan.files.size() << " files" << std::endl;
    if (scan.stats.glob_filtered > 0) {
        progress << "Filtered by glob: " << scan.stats.glob_filtered << " files" << std::endl;
    }
    if (scan.stats.ignored > 0) {
        progress << "Ignored by patterns: " << scan.stats.ignored << " files/directories" << std::endl;
    }
    if (scan.stats.size_filtered > 0) {
        progress << "Filtered by size: " << scan.stats.size_filtered << " files" << std::endl;
    }
    if (scan.stats.non_text > 0) {
        progress << "Skipped non-text: " << scan.stats.non_text << " files" << std::endl;
    }

    std::string tree;
    if (options.show_tree) {
        tree = m_tree_renderer.render(options.target_dir);
    }

    std::string list;
    if (options.show_list) {
        list = FileListBuilder(options.target_dir).build(scan.files);
    }

    if (display_only) {
        transition(MergePhase::RenderingViews);
        displayViews(options, scan, tree, list);
        transition(MergePhase::Done);
        report.final_phase = m_phase;
        return report;
    }

    // Streaming output and explicit --yes never prompt
    if (!options.skip_confirm && !options.to_stdout && !options.output_file.empty()) {
        transition(MergePhase::Confirming);
        if (!confirm(options.output_file)) {
            m_out << "Cancelled" << std::endl;
            transition(MergePhase::Cancelled);
            report.final_phase = m_phase;
            return report;
        }
    }

    transition(MergePhase::Merging);
    progress << "Merging..." << std::endl;

    GenerateOptions generate_options;
    generate_options.include_stats = options.show_stats;
    generate_options.include_tree = options.show_tree;
    generate_options.include_list = options.show_list;
    generate_options.include_merge = options.include_merge;
    generate_options.tree_structure = tree;
    generate_options.list_structure = list;
    generate_options.window = options.window;

    GeneratedContent generated = m_generator.generate(scan.files, options.target_dir,
                                                      generate_options, m_sanitizer);
    report.sanitize_stats = generated.sanitize_stats;

    transition(MergePhase::Writing);
    if (options.to_stdout) {
        m_out << generated.content << std::endl;
        m_err << "Done! " << scan.files.size() << " files merged" << std::endl;
        printSanitizeStats(m_err, generated.sanitize_stats);
    } else {
        writeOutputFile(options.output_file, generated.content);
        m_out << "\nDone! " << scan.files.size() << " files merged into '" << options.output_file << "'" << std::endl;
        printSanitizeStats(m_out, generated.sanitize_stats);
    }

    report.files_merged = scan.files.size();
    transition(MergePhase::Done);
    report.final_phase = m_phase;
    return report;
}

void Merger::transition(MergePhase next) {
    Logger::getInstance().debug("Merger", mergePhaseName(m_phase) + " -> " + mergePhaseName(next));
    m_phase = next;
}

void Merger::displayViews(const MergeOptions& options, const ScanResult& scan,
                          const std::string& tree, const std::string& list) {
    if (options.show_tree && !tree.empty()) {
        m_out << "\nDirectory tree:\n" << tree << "\n\n";
    }

    if (options.show_list && !list.empty()) {
        m_out << "\nFile list:\n" << list << "\n\n";
    }

    if (options.show_stats) {
        Statistics::printStatistics(Statistics::calculate(scan.files), m_out);
    }

    m_out.flush();
}

bool Merger::confirm(const std::string& output_file) {
    m_out << "Merge into '" << output_file << "'? (y/n): " << std::flush;

    std::string response;
    if (!std::getline(m_in, response)) {
        m_out << std::endl;
        return false;
    }

    size_t first = response.find_first_not_of(" \t\r");
    size_t last = response.find_last_not_of(" \t\r");
    response = first == std::string::npos ? "" : response.substr(first, last - first + 1);
    std::transform(response.begin(), response.end(), response.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    return response == "y" || response == "yes";
}

void Merger::printSanitizeStats(std::ostream& stream, const SanitizeStats& stats) const {
    if (stats.empty()) {
        return;
    }
    stream << "\nSanitization stats:" << std::endl;
    for (const auto& [label, count] : stats) {
        stream << "  " << label << ": " << count << std::endl;
    }
}

void Merger::writeOutputFile(const std::string& path, const std::string& content) {
    errno = 0;
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        int error_number = errno;
        std::string reason = error_number != 0 ? std::strerror(error_number) : "cannot open file";
        throw OutputWriteError(path, reason, error_number == EACCES || error_number == EPERM);
    }

    file << content;
    file.flush();
    if (!file) {
        int error_number = errno;
        std::string reason = error_number != 0 ? std::strerror(error_number) : "write failed";
        throw OutputWriteError(path, reason, error_number == EACCES || error_number == EPERM);
    }
}

} // namespace Kasu
