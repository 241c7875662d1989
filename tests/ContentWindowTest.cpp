// =================================================================
// tests/ContentWindowTest.cpp
// =================================================================
// Unit tests for head/tail line windowing.

#include "Kasu/ContentWindow.hpp"
#include <iostream>
#include <cassert>

class ContentWindowTest {
private:
    const std::string five_lines = "line1\nline2\nline3\nline4\nline5";

    Kasu::LineWindow head(size_t n) {
        Kasu::LineWindow window;
        window.head = n;
        return window;
    }

    Kasu::LineWindow tail(size_t n) {
        Kasu::LineWindow window;
        window.tail = n;
        return window;
    }

public:
    void testNoWindow() {
        std::cout << "Testing content without a window..." << std::endl;

        Kasu::LineWindow window;
        assert(!window.isActive());
        assert(Kasu::ContentWindow::apply(five_lines, window) == five_lines);

        std::cout << "✓ No window test passed" << std::endl;
    }

    void testHead() {
        std::cout << "Testing head window..." << std::endl;

        assert(Kasu::ContentWindow::apply(five_lines, head(2)) == "line1\nline2\n... (truncated)\n");

        // Fewer lines than requested: nothing was cut, no marker
        assert(Kasu::ContentWindow::apply("only\none", head(5)) == "only\none");

        // A trailing newline counts as a final empty line
        assert(Kasu::ContentWindow::apply("a\nb\n", head(2)) == "a\nb\n... (truncated)\n");
        assert(Kasu::ContentWindow::apply("a\nb\n", head(4)) == "a\nb\n");

        assert(Kasu::ContentWindow::apply("", head(1)) == "" && "Empty result gets no marker");

        std::cout << "✓ Head window test passed" << std::endl;
    }

    void testTail() {
        std::cout << "Testing tail window..." << std::endl;

        assert(Kasu::ContentWindow::apply(five_lines, tail(2)) == "... (truncated)\nline4\nline5");

        // The marker is always prepended in tail mode
        assert(Kasu::ContentWindow::apply("short", tail(10)) == "... (truncated)\nshort");
        assert(Kasu::ContentWindow::apply("x\ny\n", tail(2)) == "... (truncated)\ny\n");

        std::cout << "✓ Tail window test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running ContentWindow unit tests..." << std::endl;

        testNoWindow();
        testHead();
        testTail();

        std::cout << "All ContentWindow tests passed!" << std::endl;
    }
};

int main() {
    try {
        ContentWindowTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All ContentWindow component tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
