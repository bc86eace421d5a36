#include "Codefeed/CliParser.hpp"
#include "Codefeed/Core.hpp"
#include "Codefeed/LlamaTokenizer.hpp"
#include "Codefeed/Tokenizer.hpp"
#include <iostream>
#include <memory>

int main(int argc, char** argv) {
    // CliParser is responsible for defining and parsing all command-line
    // arguments using the CLI11 library.
    Codefeed::CliParser parser;
    auto app = parser.setupCli();

    try {
        app->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app->exit(e);
    } catch (const std::exception& e) {
        std::cerr << "An unexpected error occurred: " << e.what() << std::endl;
        return 1;
    }

    // A model vocabulary, when given, replaces the byte-count estimate.
    auto tokenizer_factory = [](const Codefeed::RunOptions& options) -> std::unique_ptr<Codefeed::Tokenizer> {
        if (options.tokenizer_model.empty()) {
            return std::make_unique<Codefeed::HeuristicTokenizer>();
        }
        return std::make_unique<Codefeed::LlamaTokenizer>(options.tokenizer_model);
    };

    Codefeed::Core core(parser.getOptions(), tokenizer_factory);

    try {
        return core.run();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
