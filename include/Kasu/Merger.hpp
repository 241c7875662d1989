// =================================================================
// include/Kasu/Merger.hpp
// =================================================================
// Header for the merge run state machine.

#pragma once

#include "ContentGenerator.hpp"
#include "FileScanner.hpp"
#include "Sanitizer.hpp"
#include "TreeRenderer.hpp"
#include <iostream>
#include <string>

namespace Kasu {

/**
 * @brief Phases of one merge run
 *
 * Idle -> Scanning -> RenderingViews -> Done                  (display-only)
 * Idle -> Scanning -> Confirming -> Merging -> Writing -> Done
 * Confirming -> Cancelled when the operator declines.
 */
enum class MergePhase {
    Idle,
    Scanning,
    RenderingViews,
    Confirming,
    Merging,
    Writing,
    Done,
    Cancelled
};

std::string mergePhaseName(MergePhase phase);

/**
 * @brief Parameters of one merge run
 */
struct MergeOptions {
    std::string target_dir;
    std::string output_file;        ///< Empty when no file is written
    bool to_stdout = false;
    bool show_tree = false;
    bool show_list = false;
    bool show_stats = false;
    bool skip_confirm = false;
    bool include_merge = true;
    LineWindow window;
};

/**
 * @brief Outcome of a merge run
 */
struct MergeReport {
    MergePhase final_phase = MergePhase::Idle;
    size_t files_merged = 0;
    ScanStatistics scan_stats;
    SanitizeStats sanitize_stats;
};

/**
 * @brief Runs scan, optional views, confirmation, assembly and writing
 *
 * Progress lines go to the console stream, or to the diagnostic stream when
 * the document itself is written to the console. The confirmation prompt
 * always happens before anything is written.
 */
class Merger {
public:
    /**
     * @brief Construct a merger
     * @param scanner Traversal engine
     * @param generator Document renderer
     * @param sanitizer Redaction applied to file bodies
     * @param tree_renderer Tree view builder
     * @param out Console stream (document in --stdout mode, progress otherwise)
     * @param err Diagnostic stream
     * @param in Confirmation input
     */
    Merger(const FileScanner& scanner,
           const ContentGenerator& generator,
           const Sanitizer& sanitizer,
           const TreeRenderer& tree_renderer,
           std::ostream& out = std::cout,
           std::ostream& err = std::cerr,
           std::istream& in = std::cin);

    /**
     * @brief Execute one run
     * @param options Run parameters
     * @return Report of the run
     * @throws OutputWriteError if the destination cannot be written
     */
    MergeReport merge(const MergeOptions& options);

    MergePhase getPhase() const { return m_phase; }

    /**
     * @brief Check whether a run only displays views
     *
     * True when a view is requested and neither an output file nor stdout
     * output was asked for.
     */
    static bool isDisplayOnly(const MergeOptions& options);

    /**
     * @brief Write a document to a file, replacing it
     * @param path Destination
     * @param content Document text
     * @throws OutputWriteError if the file cannot be opened or written
     */
    static void writeOutputFile(const std::string& path, const std::string& content);

private:
    const FileScanner& m_scanner;
    const ContentGenerator& m_generator;
    const Sanitizer& m_sanitizer;
    const TreeRenderer& m_tree_renderer;
    std::ostream& m_out;
    std::ostream& m_err;
    std::istream& m_in;
    MergePhase m_phase;

    void transition(MergePhase next);

    void displayViews(const MergeOptions& options, const ScanResult& scan,
                      const std::string& tree, const std::string& list);

    /**
     * @brief Ask the operator before writing
     * @return true if the answer is y or yes
     */
    bool confirm(const std::string& output_file);

    void printSanitizeStats(std::ostream& stream, const SanitizeStats& stats) const;
};

} // namespace Kasu
