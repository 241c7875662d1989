// =================================================================
// tests/MergerTest.cpp
// =================================================================
// Unit tests for the merge run state machine.

#include "Kasu/Merger.hpp"
#include "Kasu/Errors.hpp"
#include "Kasu/PathMatcher.hpp"
#include "Kasu/TextGenerator.hpp"
#include "Kasu/TreeRenderer.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cassert>

namespace fs = std::filesystem;

namespace {

std::string readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

} // namespace

class MergerTest {
private:
    std::string test_dir;
    std::string output_dir;

    void setupTestFiles() {
        fs::create_directories(test_dir + "/src");
        fs::create_directories(output_dir);
        std::ofstream(test_dir + "/src/main.py") << "print('hi')\n";
        std::ofstream(test_dir + "/README.md") << "contact: admin@example.org\n";
    }

    void cleanupTestFiles() {
        fs::remove_all(test_dir);
        fs::remove_all(output_dir);
    }

    /**
     * @brief Components and streams of one merge run
     */
    struct Harness {
        Kasu::GlobMatcher glob;
        Kasu::IgnoreMatcher ignore;
        Kasu::FileScanner scanner;
        Kasu::TreeRenderer tree;
        Kasu::TextGenerator generator;
        Kasu::Sanitizer sanitizer;
        std::ostringstream out;
        std::ostringstream err;
        std::istringstream in;
        Kasu::Merger merger;

        Harness(const std::string& root, const std::string& answer, bool sanitize = false)
            : glob(root, {}),
              ignore(root, {}),
              scanner(glob, ignore),
              tree(glob, ignore),
              sanitizer(sanitize),
              in(answer),
              merger(scanner, generator, sanitizer, tree, out, err, in) {}
    };

    Kasu::MergeOptions baseOptions() {
        Kasu::MergeOptions options;
        options.target_dir = test_dir;
        return options;
    }

public:
    MergerTest() : test_dir("test_merger_input"), output_dir("test_merger_output") {}

    void testDisplayOnlyDetection() {
        std::cout << "Testing display-only detection..." << std::endl;

        Kasu::MergeOptions options;
        assert(!Kasu::Merger::isDisplayOnly(options) && "No view requested");

        options.show_tree = true;
        assert(Kasu::Merger::isDisplayOnly(options));

        options.output_file = "out.txt";
        assert(!Kasu::Merger::isDisplayOnly(options) && "A destination turns views into sections");

        options.output_file.clear();
        options.to_stdout = true;
        assert(!Kasu::Merger::isDisplayOnly(options));

        std::cout << "✓ Display-only detection test passed" << std::endl;
    }

    void testStdoutMode() {
        std::cout << "Testing merge to the console..." << std::endl;

        setupTestFiles();

        Harness harness(test_dir, "");
        auto options = baseOptions();
        options.to_stdout = true;

        auto report = harness.merger.merge(options);

        assert(report.final_phase == Kasu::MergePhase::Done);
        assert(report.files_merged == 2);
        assert(harness.merger.getPhase() == Kasu::MergePhase::Done);

        std::string out = harness.out.str();
        std::string err = harness.err.str();
        assert(out.find("--- /src/main.py ---\nprint('hi')\n") != std::string::npos);
        assert(out.find("--- /README.md ---") != std::string::npos);
        assert(out.find("Scanning files...") == std::string::npos && "Progress stays off the document stream");
        assert(out.find("(y/n)") == std::string::npos && "Streaming output never prompts");
        assert(err.find("Scanning files...\nFound 2 files\n") != std::string::npos);
        assert(err.find("Done! 2 files merged") != std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Console merge test passed" << std::endl;
    }

    void testWriteWithoutPrompt() {
        std::cout << "Testing merge into a file with --yes..." << std::endl;

        setupTestFiles();

        Harness harness(test_dir, "");
        auto options = baseOptions();
        options.output_file = output_dir + "/merged.txt";
        options.skip_confirm = true;

        auto report = harness.merger.merge(options);

        assert(report.final_phase == Kasu::MergePhase::Done);
        assert(fs::exists(options.output_file));
        std::string written = readFile(options.output_file);
        assert(written.find("--- /src/main.py ---") != std::string::npos);
        assert(written.find("--- /README.md ---\ncontact: admin@example.org\n") != std::string::npos);

        std::string out = harness.out.str();
        assert(out.find("(y/n)") == std::string::npos);
        assert(out.find("Merging...") != std::string::npos);
        assert(out.find("Done! 2 files merged into '" + options.output_file + "'") != std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ File merge test passed" << std::endl;
    }

    void testConfirmationDeclined() {
        std::cout << "Testing declined confirmation..." << std::endl;

        setupTestFiles();

        Harness harness(test_dir, "n\n");
        auto options = baseOptions();
        options.output_file = output_dir + "/merged.txt";

        auto report = harness.merger.merge(options);

        assert(report.final_phase == Kasu::MergePhase::Cancelled);
        assert(report.files_merged == 0);
        assert(!fs::exists(options.output_file) && "Nothing is written before confirmation");

        std::string out = harness.out.str();
        assert(out.find("Merge into '" + options.output_file + "'? (y/n): ") != std::string::npos);
        assert(out.find("Cancelled") != std::string::npos);
        assert(out.find("Merging...") == std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Declined confirmation test passed" << std::endl;
    }

    void testConfirmationAccepted() {
        std::cout << "Testing accepted confirmation..." << std::endl;

        setupTestFiles();

        Harness harness(test_dir, "  Yes \n");
        auto options = baseOptions();
        options.output_file = output_dir + "/merged.txt";

        auto report = harness.merger.merge(options);

        assert(report.final_phase == Kasu::MergePhase::Done);
        assert(fs::exists(options.output_file));

        // Closed input counts as a refusal
        Harness closed(test_dir, "");
        auto closed_report = closed.merger.merge(options);
        assert(closed_report.final_phase == Kasu::MergePhase::Cancelled);

        cleanupTestFiles();
        std::cout << "✓ Accepted confirmation test passed" << std::endl;
    }

    void testDisplayOnlyRun() {
        std::cout << "Testing display-only run..." << std::endl;

        setupTestFiles();

        Harness harness(test_dir, "");
        auto options = baseOptions();
        options.show_tree = true;
        options.show_list = true;
        options.show_stats = true;

        auto report = harness.merger.merge(options);

        assert(report.final_phase == Kasu::MergePhase::Done);
        assert(report.files_merged == 0);

        std::string out = harness.out.str();
        assert(out.find("\nDirectory tree:\ntest_merger_input/\n") != std::string::npos);
        assert(out.find("├── src/\n│   └── main.py\n└── README.md") != std::string::npos);
        assert(out.find("\nFile list:\n") != std::string::npos);
        assert(out.find("src/main.py") != std::string::npos);
        assert(out.find("Total files:  2") != std::string::npos);
        assert(out.find("--- /src/main.py ---") == std::string::npos && "No document is assembled");
        assert(out.find("(y/n)") == std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Display-only run test passed" << std::endl;
    }

    void testSanitizationReport() {
        std::cout << "Testing sanitization report..." << std::endl;

        setupTestFiles();

        Harness harness(test_dir, "", true);
        auto options = baseOptions();
        options.output_file = output_dir + "/merged.txt";
        options.skip_confirm = true;

        auto report = harness.merger.merge(options);

        assert(report.sanitize_stats.at("Email addresses") == 1);
        assert(readFile(options.output_file).find("admin@example.org") == std::string::npos);
        assert(harness.out.str().find("Sanitization stats:\n  Email addresses: 1\n") != std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Sanitization report test passed" << std::endl;
    }

    void testWriteFailure() {
        std::cout << "Testing write failure..." << std::endl;

        setupTestFiles();

        Harness harness(test_dir, "");
        auto options = baseOptions();
        options.output_file = output_dir + "/no_such_dir/merged.txt";
        options.skip_confirm = true;

        bool thrown = false;
        try {
            harness.merger.merge(options);
        } catch (const Kasu::OutputWriteError& e) {
            thrown = true;
            assert(e.path() == options.output_file);
            assert(!e.isPermissionDenied());
        }
        assert(thrown && "Write failures are fatal");
        assert(harness.merger.getPhase() == Kasu::MergePhase::Writing);

        cleanupTestFiles();
        std::cout << "✓ Write failure test passed" << std::endl;
    }

    void testPhaseNames() {
        std::cout << "Testing phase names..." << std::endl;

        assert(Kasu::mergePhaseName(Kasu::MergePhase::Idle) == "Idle");
        assert(Kasu::mergePhaseName(Kasu::MergePhase::RenderingViews) == "RenderingViews");
        assert(Kasu::mergePhaseName(Kasu::MergePhase::Cancelled) == "Cancelled");

        std::cout << "✓ Phase names test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Merger unit tests..." << std::endl;

        testDisplayOnlyDetection();
        testStdoutMode();
        testWriteWithoutPrompt();
        testConfirmationDeclined();
        testConfirmationAccepted();
        testDisplayOnlyRun();
        testSanitizationReport();
        testWriteFailure();
        testPhaseNames();

        std::cout << "All Merger tests passed!" << std::endl;
    }
};

int main() {
    try {
        MergerTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Merger component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
