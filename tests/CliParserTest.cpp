// =================================================================
// tests/CliParserTest.cpp
// =================================================================
// Unit tests for command-line and environment option handling.

#include "Codefeed/CliParser.hpp"
#include <iostream>
#include <cassert>
#include <cstdlib>
#include <string>
#include <vector>

class CliParserTest {
private:
    // Parse a vector of arguments as if they came from main()
    static void parse(CLI::App& app, std::vector<std::string> args) {
        std::vector<char*> argv;
        static std::string program = "codefeed";
        argv.push_back(&program[0]);
        for (auto& arg : args) {
            argv.push_back(&arg[0]);
        }
        app.parse(static_cast<int>(argv.size()), argv.data());
    }

public:
    void testDefaults() {
        std::cout << "Testing default options..." << std::endl;

        Codefeed::CliParser parser;
        auto app = parser.setupCli();
        parse(*app, {});

        const auto& options = parser.getOptions();
        assert(!options.report);
        assert(options.max_file_size == 1048576ULL);
        assert(options.max_total_size == 104857600ULL);
        assert(options.max_files == 10000);
        assert(options.tokenizer_model.empty());
        assert(options.verbosity == 0);
        assert(options.log_file.empty());

        std::cout << "✓ Default options test passed" << std::endl;
    }

    void testLimitFlags() {
        std::cout << "Testing limit flags..." << std::endl;

        Codefeed::CliParser parser;
        auto app = parser.setupCli();
        parse(*app, {"-f", "2048", "--total-size", "4096", "-n", "3", "-r"});

        const auto& options = parser.getOptions();
        assert(options.report);
        assert(options.max_file_size == 2048);
        assert(options.max_total_size == 4096);
        assert(options.max_files == 3);

        Codefeed::Limits limits = options.limits();
        assert(limits.max_file_size == 2048);
        assert(limits.max_total_size == 4096);
        assert(limits.max_files == 3);

        std::cout << "✓ Limit flags test passed" << std::endl;
    }

    void testVerbosity() {
        std::cout << "Testing verbosity counting..." << std::endl;

        Codefeed::CliParser parser;
        auto app = parser.setupCli();
        parse(*app, {"-vv", "--log-file", "/tmp/codefeed.log"});

        assert(parser.getOptions().verbosity == 2);
        assert(parser.getOptions().log_file == "/tmp/codefeed.log");

        std::cout << "✓ Verbosity test passed" << std::endl;
    }

    void testEnvironmentFallback() {
        std::cout << "Testing environment fallback..." << std::endl;

        setenv("CODEFEED_NUM_FILES", "7", 1);
        {
            Codefeed::CliParser parser;
            auto app = parser.setupCli();
            parse(*app, {});
            assert(parser.getOptions().max_files == 7 && "Environment fills unset options");
        }
        {
            Codefeed::CliParser parser;
            auto app = parser.setupCli();
            parse(*app, {"-n", "9"});
            assert(parser.getOptions().max_files == 9 && "Command line wins over environment");
        }
        unsetenv("CODEFEED_NUM_FILES");

        std::cout << "✓ Environment fallback test passed" << std::endl;
    }

    void testRejectsBadInput() {
        std::cout << "Testing invalid arguments..." << std::endl;

        Codefeed::CliParser parser;
        auto app = parser.setupCli();
        bool threw = false;
        try {
            parse(*app, {"--num-files", "many"});
        } catch (const CLI::ParseError&) {
            threw = true;
        }
        assert(threw && "Non-numeric limit is a parse error");

        Codefeed::CliParser model_parser;
        auto model_app = model_parser.setupCli();
        threw = false;
        try {
            parse(*model_app, {"--tokenizer-model", "/nonexistent/model.gguf"});
        } catch (const CLI::ParseError&) {
            threw = true;
        }
        assert(threw && "Tokenizer model must exist");

        std::cout << "✓ Invalid arguments test passed" << std::endl;
    }

    void runAllTests() {
        std::cout << "Running CliParser unit tests..." << std::endl;

        testDefaults();
        testLimitFlags();
        testVerbosity();
        testEnvironmentFallback();
        testRejectsBadInput();

        std::cout << "All CliParser tests passed!" << std::endl;
    }
};

int main() {
    try {
        CliParserTest tests;
        tests.runAllTests();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
