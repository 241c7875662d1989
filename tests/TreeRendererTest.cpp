// =================================================================
// tests/TreeRendererTest.cpp
// =================================================================
// Unit tests for the directory tree view.

#include "Kasu/TreeRenderer.hpp"
#include "Kasu/PathMatcher.hpp"
#include <iostream>
#include <filesystem>
#include <fstream>
#include <cassert>
#include <unistd.h>

namespace fs = std::filesystem;

class TreeRendererTest {
private:
    std::string test_dir;

    void setupTestFiles() {
        fs::create_directories(test_dir + "/src/util");
        fs::create_directories(test_dir + "/docs");
        fs::create_directories(test_dir + "/.git");

        std::ofstream(test_dir + "/src/main.cpp") << "int main() { return 0; }\n";
        std::ofstream(test_dir + "/src/util/strings.hpp") << "#pragma once\n";
        std::ofstream(test_dir + "/docs/guide.md") << "# Guide\n";
        std::ofstream(test_dir + "/README.md") << "# Project\n";
        std::ofstream(test_dir + "/.git/HEAD") << "ref: refs/heads/main\n";
        std::ofstream(test_dir + "/logo.png", std::ios::binary) << std::string("\x89PNG\0\0", 6);
    }

    void cleanupTestFiles() {
        if (fs::exists(test_dir)) {
            fs::remove_all(test_dir);
        }
    }

public:
    TreeRendererTest() : test_dir("test_tree_renderer") {}

    void testRenderLayout() {
        std::cout << "Testing tree layout..." << std::endl;

        setupTestFiles();

        Kasu::GlobMatcher glob(test_dir, {});
        Kasu::IgnoreMatcher ignore(test_dir, {}, false, true);
        Kasu::TreeRenderer renderer(glob, ignore);

        std::string expected =
            "test_tree_renderer/\n"
            "├── docs/\n"
            "│   └── guide.md\n"
            "├── src/\n"
            "│   ├── util/\n"
            "│   │   └── strings.hpp\n"
            "│   └── main.cpp\n"
            "└── README.md";

        std::string tree = renderer.render(test_dir);
        assert(tree == expected && "Directories first, sorted, binary and VCS entries hidden");

        cleanupTestFiles();
        std::cout << "✓ Tree layout test passed" << std::endl;
    }

    void testGlobFiltersFilesOnly() {
        std::cout << "Testing include patterns in the tree..." << std::endl;

        setupTestFiles();

        Kasu::GlobMatcher glob(test_dir, {"*.md"});
        Kasu::IgnoreMatcher ignore(test_dir, {".git/"});
        Kasu::TreeRenderer renderer(glob, ignore);

        std::string tree = renderer.render(test_dir);

        assert(tree.find("guide.md") != std::string::npos);
        assert(tree.find("README.md") != std::string::npos);
        assert(tree.find("main.cpp") == std::string::npos && "Non-matching files are hidden");
        assert(tree.find("src/") != std::string::npos && "Directories survive include patterns");
        assert(tree.find(".git") == std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Include pattern test passed" << std::endl;
    }

    void testSymlinksHidden() {
        std::cout << "Testing symbolic links are hidden..." << std::endl;

        setupTestFiles();

        std::error_code ec;
        fs::create_symlink(fs::absolute(test_dir + "/README.md"), test_dir + "/alias.md", ec);
        if (ec) {
            std::cout << "  (symlinks unsupported here, skipping)" << std::endl;
            cleanupTestFiles();
            return;
        }

        Kasu::GlobMatcher glob(test_dir, {});
        Kasu::IgnoreMatcher ignore(test_dir, {});
        Kasu::TreeRenderer renderer(glob, ignore);

        assert(renderer.render(test_dir).find("alias.md") == std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Symlink test passed" << std::endl;
    }

    void testUnreadableDirectorySkipped() {
        std::cout << "Testing unreadable directories render empty..." << std::endl;

        if (geteuid() == 0) {
            std::cout << "  (running as root, permissions are not enforced, skipping)" << std::endl;
            return;
        }

        cleanupTestFiles();
        fs::create_directories(test_dir + "/locked");
        std::ofstream(test_dir + "/locked/secret.txt") << "hidden\n";
        std::ofstream(test_dir + "/open.txt") << "visible\n";
        fs::permissions(test_dir + "/locked", fs::perms::none);

        Kasu::GlobMatcher glob(test_dir, {});
        Kasu::IgnoreMatcher ignore(test_dir, {});
        Kasu::TreeRenderer renderer(glob, ignore);

        std::string tree = renderer.render(test_dir);

        fs::permissions(test_dir + "/locked", fs::perms::owner_all);

        assert(tree ==
               "test_tree_renderer/\n"
               "├── locked/\n"
               "└── open.txt");
        assert(tree.find("secret.txt") == std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Unreadable directory test passed" << std::endl;
    }

    void testRootLabel() {
        std::cout << "Testing root label..." << std::endl;

        assert(Kasu::TreeRenderer::rootLabel("some/project") == "project");
        assert(Kasu::TreeRenderer::rootLabel("some/project/") == "project");
        assert(Kasu::TreeRenderer::rootLabel("/") == "/");

        fs::create_directories(test_dir);
        Kasu::GlobMatcher glob(test_dir, {});
        Kasu::IgnoreMatcher ignore(test_dir, {});
        Kasu::TreeRenderer renderer(glob, ignore);
        assert(renderer.render(test_dir) == "test_tree_renderer/" && "Empty directory renders only its label");

        cleanupTestFiles();
        std::cout << "✓ Root label test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running TreeRenderer unit tests..." << std::endl;

        testRenderLayout();
        testGlobFiltersFilesOnly();
        testSymlinksHidden();
        testUnreadableDirectorySkipped();
        testRootLabel();

        std::cout << "All TreeRenderer tests passed!" << std::endl;
    }
};

int main() {
    try {
        TreeRendererTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All TreeRenderer component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
