// =================================================================
// tests/PathMatcherTest.cpp
// =================================================================
// Unit tests for the include and exclude path matchers.

#include "Kasu/PathMatcher.hpp"
#include "Kasu/Errors.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <vector>

namespace fs = std::filesystem;

class PathMatcherTest {
private:
    std::string test_dir;

    void setupTestFiles() {
        fs::create_directories(test_dir + "/src/sub");
        fs::create_directories(test_dir + "/.git");

        std::ofstream(test_dir + "/src/main.py") << "print(1)";
        std::ofstream(test_dir + "/src/sub/util.py") << "pass";
        std::ofstream(test_dir + "/root.py") << "pass";
        std::ofstream(test_dir + "/.gitignore") << "*.log\n# comment\nbuild/\n";
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    PathMatcherTest() : test_dir("test_path_matcher") {}

    void testRelativePath() {
        std::cout << "Testing root-relative path conversion..." << std::endl;

        setupTestFiles();

        Kasu::GlobMatcher matcher(test_dir, {});
        auto relative = matcher.relativePath(fs::path(test_dir) / "src" / "main.py");
        assert(relative && *relative == "src/main.py");

        auto with_slash = Kasu::PathMatcher::makeRelative(fs::path(test_dir) / "root.py", test_dir + "/");
        assert(with_slash && *with_slash == "root.py" && "Trailing slash on the root is tolerated");

        auto root_itself = matcher.relativePath(fs::path(test_dir));
        assert(root_itself && *root_itself == ".");

        cleanupTestFiles();
        std::cout << "✓ Relative path test passed" << std::endl;
    }

    void testGlobMatchAllWithoutPatterns() {
        std::cout << "Testing include matcher without patterns..." << std::endl;

        setupTestFiles();

        Kasu::GlobMatcher matcher(test_dir, {});
        assert(!matcher.isActive());
        assert(matcher.role() == Kasu::MatcherRole::Include);
        assert(matcher.shouldInclude(fs::path(test_dir) / "root.py", false));
        assert(matcher.shouldInclude(fs::path(test_dir) / "anything.bin", false));

        cleanupTestFiles();
        std::cout << "✓ Match-all test passed" << std::endl;
    }

    void testGlobPatterns() {
        std::cout << "Testing include matcher patterns..." << std::endl;

        setupTestFiles();

        Kasu::GlobMatcher matcher(test_dir, {"src/**/*.py"});
        assert(matcher.isActive());
        assert(matcher.shouldInclude(fs::path(test_dir) / "src/main.py", false));
        assert(matcher.shouldInclude(fs::path(test_dir) / "src/sub/util.py", false));
        assert(!matcher.shouldInclude(fs::path(test_dir) / "root.py", false));

        // Directories always pass so the walk can reach matching files
        assert(matcher.shouldInclude(fs::path(test_dir) / ".git", true));
        assert(matcher.shouldInclude(fs::path(test_dir) / "src"));

        cleanupTestFiles();
        std::cout << "✓ Include patterns test passed" << std::endl;
    }

    void testMalformedGlobThrows() {
        std::cout << "Testing malformed include pattern..." << std::endl;

        bool thrown = false;
        try {
            Kasu::GlobMatcher matcher(".", {"*.py", "src/[abc"});
        } catch (const Kasu::PatternError& e) {
            thrown = true;
            assert(std::string(e.what()).find("src/[abc") != std::string::npos);
        }
        assert(thrown && "Malformed include pattern must be fatal");

        std::cout << "✓ Malformed include pattern test passed" << std::endl;
    }

    void testIgnoreMatcher() {
        std::cout << "Testing exclude matcher..." << std::endl;

        setupTestFiles();

        Kasu::IgnoreMatcher matcher(test_dir, {"*.log", "build/", "[broken"});
        assert(matcher.role() == Kasu::MatcherRole::Exclude);
        assert(matcher.patternCount() == 2 && "Malformed exclude pattern is skipped");

        assert(!matcher.shouldInclude(fs::path(test_dir) / "b.log", false));
        assert(matcher.isIgnored(fs::path(test_dir) / "src/deep/c.log", false));
        assert(!matcher.shouldInclude(fs::path(test_dir) / "build", true));
        assert(matcher.shouldInclude(fs::path(test_dir) / "build", false));
        assert(matcher.shouldInclude(fs::path(test_dir) / "src/main.py", false));

        cleanupTestFiles();
        std::cout << "✓ Exclude matcher test passed" << std::endl;
    }

    void testVcsAutoIgnore() {
        std::cout << "Testing VCS housekeeping patterns..." << std::endl;

        setupTestFiles();

        Kasu::IgnoreMatcher without_vcs(test_dir, {});
        assert(without_vcs.shouldInclude(fs::path(test_dir) / ".git", true));
        assert(without_vcs.shouldInclude(fs::path(test_dir) / ".gitignore", false));

        Kasu::IgnoreMatcher with_vcs(test_dir, {}, false, true);
        assert(with_vcs.patternCount() == Kasu::VCS_IGNORE_PATTERNS.size());
        assert(!with_vcs.shouldInclude(fs::path(test_dir) / ".git", true));
        assert(!with_vcs.shouldInclude(fs::path(test_dir) / ".gitignore", false));
        assert(!with_vcs.shouldInclude(fs::path(test_dir) / ".gitmodules", false));
        assert(!with_vcs.shouldInclude(fs::path(test_dir) / ".hg", true));
        assert(with_vcs.shouldInclude(fs::path(test_dir) / "src/main.py", false));

        cleanupTestFiles();
        std::cout << "✓ VCS auto-ignore test passed" << std::endl;
    }

    void testNegationInExcludes() {
        std::cout << "Testing negation in exclude patterns..." << std::endl;

        setupTestFiles();

        Kasu::IgnoreMatcher matcher(test_dir, {"*.log", "!keep.log"});
        assert(!matcher.shouldInclude(fs::path(test_dir) / "drop.log", false));
        assert(matcher.shouldInclude(fs::path(test_dir) / "keep.log", false));

        cleanupTestFiles();
        std::cout << "✓ Negation test passed" << std::endl;
    }

    void testPatternFileLoading() {
        std::cout << "Testing ignore file detection and loading..." << std::endl;

        setupTestFiles();

        auto detected = Kasu::IgnoreMatcher::autoDetectIgnoreFile(test_dir);
        assert(detected && "Should detect .gitignore");
        assert(fs::path(*detected).filename() == ".gitignore");

        fs::create_directories(test_dir + "/empty");
        assert(!Kasu::IgnoreMatcher::autoDetectIgnoreFile(test_dir + "/empty"));

        std::ofstream(test_dir + "/extra.ignore") << "*.tmp\n";
        auto patterns = Kasu::IgnoreMatcher::loadPatternsFromFiles(
            {*detected, "", test_dir + "/extra.ignore"});
        assert(patterns.size() == 3);
        assert(patterns[0] == "*.log");
        assert(patterns[1] == "build/");
        assert(patterns[2] == "*.tmp");

        cleanupTestFiles();
        std::cout << "✓ Pattern file loading test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running PathMatcher unit tests..." << std::endl;

        testRelativePath();
        testGlobMatchAllWithoutPatterns();
        testGlobPatterns();
        testMalformedGlobThrows();
        testIgnoreMatcher();
        testVcsAutoIgnore();
        testNegationInExcludes();
        testPatternFileLoading();

        std::cout << "All PathMatcher tests passed!" << std::endl;
    }
};

int main() {
    try {
        PathMatcherTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All PathMatcher component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
