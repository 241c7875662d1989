// =================================================================
// tests/CoreTest.cpp
// =================================================================
// End-to-end tests for a complete run through Core.

#include "Kasu/Core.hpp"
#include "Kasu/Logger.hpp"
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

class CoreTest {
private:
    std::string test_dir;
    std::string output_dir;
    std::ostringstream log_stream;

    void setupTestFiles() {
        fs::create_directories(test_dir + "/src");
        fs::create_directories(test_dir + "/.git");
        fs::create_directories(output_dir);

        std::ofstream(test_dir + "/src/app.py") << "import os\nprint(os.name)\n";
        std::ofstream(test_dir + "/notes.md") << "# Notes\nserver at 203.0.113.9\n";
        std::ofstream(test_dir + "/debug.log") << "trace\n";
        std::ofstream(test_dir + "/.gitignore") << "*.log\n";
        std::ofstream(test_dir + "/.git/HEAD") << "ref: refs/heads/main\n";
    }

    void cleanupTestFiles() {
        fs::remove_all(test_dir);
        fs::remove_all(output_dir);
        log_stream.str("");
    }

    int runCore(const Kasu::Commands& commands, std::string* out_text = nullptr,
                const std::string& answer = "") {
        std::ostringstream out;
        std::ostringstream err;
        std::istringstream in(answer);
        Kasu::Core core(commands, out, err, in);
        int status = core.run();
        if (out_text) {
            *out_text = out.str();
        }
        return status;
    }

    Kasu::Commands baseCommands() {
        Kasu::Commands commands;
        commands.input = test_dir;
        commands.output = output_dir + "/merged.txt";
        commands.yes = true;
        return commands;
    }

public:
    CoreTest() : test_dir("test_core_input"), output_dir("test_core_output") {
        Kasu::Logger::getInstance().setConsoleStream(log_stream);
    }

    ~CoreTest() {
        Kasu::Logger::getInstance().setConsoleStream(std::cerr);
    }

    void testSuccessfulRun() {
        std::cout << "Testing a complete merge run..." << std::endl;

        setupTestFiles();

        int status = runCore(baseCommands());
        assert(status == Kasu::EXIT_OK);

        std::string merged = readFile(output_dir + "/merged.txt");
        assert(merged.find("--- /src/app.py ---\nimport os\n") != std::string::npos);
        assert(merged.find("--- /notes.md ---") != std::string::npos);
        assert(merged.find("debug.log") == std::string::npos && "Auto-detected .gitignore applies");
        assert(merged.find("--- /.gitignore ---") == std::string::npos && "VCS files are excluded");
        assert(merged.find(".git/HEAD") == std::string::npos);

        assert(log_stream.str().find("Auto-detected and using:") != std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Complete run test passed" << std::endl;
    }

    void testNoAutoIgnore() {
        std::cout << "Testing disabled auto-ignore..." << std::endl;

        setupTestFiles();

        Kasu::Commands commands = baseCommands();
        commands.no_auto_ignore = true;
        commands.exclude = std::vector<std::string>{".git/"};
        assert(runCore(commands) == Kasu::EXIT_OK);

        std::string merged = readFile(output_dir + "/merged.txt");
        assert(merged.find("--- /debug.log ---") != std::string::npos);
        assert(merged.find("--- /.gitignore ---") != std::string::npos);
        assert(merged.find("HEAD") == std::string::npos && "Exclude patterns still apply");

        cleanupTestFiles();
        std::cout << "✓ Disabled auto-ignore test passed" << std::endl;
    }

    void testMarkdownSanitizedHead() {
        std::cout << "Testing Markdown, sanitization and head together..." << std::endl;

        setupTestFiles();

        Kasu::Commands commands = baseCommands();
        commands.output = output_dir + "/merged.md";
        commands.format = "md";
        commands.sanitize = true;
        commands.head = 2;
        commands.glob = std::vector<std::string>{"*.md"};
        assert(runCore(commands) == Kasu::EXIT_OK);

        std::string merged = readFile(output_dir + "/merged.md");
        assert(merged.find("### `/notes.md`\n\n```markdown\n# Notes\nserver at [REDACTED_IP_1]\n") != std::string::npos);
        assert(merged.find("app.py") == std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Markdown, sanitization and head test passed" << std::endl;
    }

    void testReplacementRules() {
        std::cout << "Testing custom replacement file..." << std::endl;

        setupTestFiles();
        std::ofstream(output_dir + "/rules.txt") << "os.name -> PLATFORM\n";

        Kasu::Commands commands = baseCommands();
        commands.replace_file = output_dir + "/rules.txt";
        std::string out;
        assert(runCore(commands, &out) == Kasu::EXIT_OK);

        std::string merged = readFile(output_dir + "/merged.txt");
        assert(merged.find("print(PLATFORM)") != std::string::npos);
        assert(out.find("Custom: os.name: 1") != std::string::npos);

        Kasu::Commands missing_rules = baseCommands();
        missing_rules.replace_file = output_dir + "/none.txt";
        assert(runCore(missing_rules) == Kasu::EXIT_OK && "A missing rules file only warns");
        assert(log_stream.str().find("Replacement patterns file not found") != std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Custom replacement file test passed" << std::endl;
    }

    void testValidationFailures() {
        std::cout << "Testing validation exit status..." << std::endl;

        setupTestFiles();

        Kasu::Commands no_output;
        no_output.input = test_dir;
        assert(runCore(no_output) == Kasu::EXIT_VALIDATION_ERROR);

        Kasu::Commands missing_input = baseCommands();
        missing_input.input = test_dir + "/nowhere";
        assert(runCore(missing_input) == Kasu::EXIT_VALIDATION_ERROR);

        Kasu::Commands both_windows = baseCommands();
        both_windows.head = 1;
        both_windows.tail = 1;
        assert(runCore(both_windows) == Kasu::EXIT_VALIDATION_ERROR);

        Kasu::Commands bad_glob = baseCommands();
        bad_glob.glob = std::vector<std::string>{"src/[abc"};
        assert(runCore(bad_glob) == Kasu::EXIT_VALIDATION_ERROR);

        Kasu::Commands bad_config = baseCommands();
        bad_config.config_file = output_dir + "/absent.yaml";
        assert(runCore(bad_config) == Kasu::EXIT_VALIDATION_ERROR);

        assert(!fs::exists(output_dir + "/merged.txt") && "Nothing is written on validation failure");

        cleanupTestFiles();
        std::cout << "✓ Validation exit status test passed" << std::endl;
    }

    void testWriteFailure() {
        std::cout << "Testing write failure exit status..." << std::endl;

        setupTestFiles();

        Kasu::Commands commands = baseCommands();
        commands.output = output_dir + "/missing/merged.txt";
        assert(runCore(commands) == Kasu::EXIT_WRITE_ERROR);
        assert(log_stream.str().find("Cannot write to") != std::string::npos);

        cleanupTestFiles();
        std::cout << "✓ Write failure test passed" << std::endl;
    }

    void testConfigFileAndDisplayOnly() {
        std::cout << "Testing config file with a display-only run..." << std::endl;

        setupTestFiles();
        std::string config_path = output_dir + "/kasu.yaml";
        std::ofstream(config_path) << "input: " << test_dir << "\ntree: true\nstats: true\n";

        Kasu::Commands commands;
        commands.config_file = config_path;
        std::string out;
        assert(runCore(commands, &out) == Kasu::EXIT_OK);

        assert(out.find("Directory tree:\ntest_core_input/\n") != std::string::npos);
        assert(out.find("Statistics") != std::string::npos);
        assert(!fs::exists(output_dir + "/merged.txt"));

        cleanupTestFiles();
        std::cout << "✓ Config file display-only test passed" << std::endl;
    }

    void testCancelledRun() {
        std::cout << "Testing a declined confirmation..." << std::endl;

        setupTestFiles();

        Kasu::Commands commands = baseCommands();
        commands.yes = false;
        std::string out;
        assert(runCore(commands, &out, "no\n") == Kasu::EXIT_OK && "Declining is not an error");
        assert(out.find("Cancelled") != std::string::npos);
        assert(!fs::exists(output_dir + "/merged.txt"));

        cleanupTestFiles();
        std::cout << "✓ Declined confirmation test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running Core integration tests..." << std::endl;

        testSuccessfulRun();
        testNoAutoIgnore();
        testMarkdownSanitizedHead();
        testReplacementRules();
        testValidationFailures();
        testWriteFailure();
        testConfigFileAndDisplayOnly();
        testCancelledRun();

        std::cout << "All Core tests passed!" << std::endl;
    }
};

int main() {
    try {
        CoreTest tests;
        tests.runAllTests();

        std::cout << "\n🎉 All Core integration tests passed!" << std::endl;
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
