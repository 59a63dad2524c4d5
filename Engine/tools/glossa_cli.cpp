#include <grammar/custom_grammar.hpp>
#include <grammar/error.hpp>
#include <grammar/grammar_registry.hpp>
#include <grammar/language_detect.hpp>
#include <grammar/parser.hpp>
#include <grammar/preprocess.hpp>
#include <grammar/tree_json.hpp>
#include <utils/config.hpp>
#include <vsa/hypervector.hpp>
#include <vsa/item_memory.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace Glossa;

namespace {

struct Options {
    std::string grammar;
    std::string language;
    std::string grammar_file;
    std::string batch_file;
    bool json = false;
    bool detect = false;
    bool preprocess = false;
    std::string text;
};

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [options] \"text\"\n"
              << "\nOptions:\n"
              << "  --grammar NAME        formal, terse, narrative, rust-gen or a custom grammar name\n"
              << "  --language CODE       en, ru, ar, fr, es or auto\n"
              << "  --grammar-file FILE   load a custom TOML grammar and make it the default\n"
              << "  --json                print the parsed trees as JSON\n"
              << "  --detect              print the detected language and confidence\n"
              << "  --preprocess          print pre-processor output as JSON\n"
              << "  --batch FILE          pre-process a JSON request {\"chunks\": [...]}\n"
              << "\nExamples:\n"
              << "  " << argv0 << " \"Dogs are mammals\"\n"
              << "  " << argv0 << " --grammar terse \"Paris is located in France\"\n"
              << "  " << argv0 << " --detect \"Москва является столицей России\"\n";
}

bool parse_args(int argc, char** argv, Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string& out) {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
            out = argv[++i];
        };
        if (arg == "--grammar") next(opts.grammar);
        else if (arg == "--language") next(opts.language);
        else if (arg == "--grammar-file") next(opts.grammar_file);
        else if (arg == "--batch") next(opts.batch_file);
        else if (arg == "--json") opts.json = true;
        else if (arg == "--detect") opts.detect = true;
        else if (arg == "--preprocess") opts.preprocess = true;
        else if (arg == "--help" || arg == "-h") return false;
        else if (!arg.empty() && arg[0] == '-' && arg.size() > 1) throw std::invalid_argument("unknown option " + arg);
        else opts.text += (opts.text.empty() ? "" : " ") + arg;
    }
    return !opts.text.empty() || !opts.batch_file.empty();
}

std::string read_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("cannot open " + path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void print_result(const ParseResult& result, const ConcreteGrammar& grammar, const LinContext& lin) {
    switch (result.kind) {
        case ParseResult::Kind::Facts:
            for (const auto& fact : result.facts) std::cout << grammar.linearize(fact, lin) << "\n";
            break;
        case ParseResult::Kind::Query:
            std::cout << "Query about: " << result.subject << "\n";
            if (result.frame && result.frame->kind) {
                std::cout << "  question word: " << question_word_name(*result.frame->kind)
                          << (result.frame->capability ? " (capability)" : "") << "\n";
            }
            break;
        case ParseResult::Kind::Command:
            std::cout << "Command: " << command_kind_name(result.command->kind);
            if (result.command->cycles) std::cout << " " << *result.command->cycles;
            if (result.command->entity) std::cout << " " << *result.command->entity;
            std::cout << "\n";
            break;
        case ParseResult::Kind::Goal:
            std::cout << "Goal: " << result.description << "\n";
            break;
        case ParseResult::Kind::Freeform:
            if (result.partial.empty()) {
                std::cout << grammar.linearize(SemanticTree::freeform(result.text), lin) << "\n";
            }
            for (const auto& tree : result.partial) std::cout << grammar.linearize(tree, lin) << "\n";
            break;
    }
}

} // namespace

int main(int argc, char** argv) {
    Options opts;
    try {
        if (!parse_args(argc, argv, opts)) {
            usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        usage(argv[0]);
        return 1;
    }

    try {
        EngineConfig config = EngineConfig::load_from_env();
        config.apply_logging();
        if (!opts.language.empty()) config.language = opts.language;

        if (opts.detect) {
            DetectionResult d = detect_language(opts.text);
            std::cout << language_code(d.language) << " (" << language_name(d.language)
                      << "), confidence " << d.confidence << "\n";
            return 0;
        }

        MemorySymbolRegistry registry;
        VsaOps ops(config.dimension);
        HypervectorIndex index(config);

        ParseContext parse_ctx = ParseContext::with_engine(registry, ops, index, language_from_code(config.language));
        parse_ctx.lexer = LexerConfig::from(config);

        if (!opts.batch_file.empty()) {
            PreProcessRequest request = nlohmann::json::parse(read_file(opts.batch_file)).get<PreProcessRequest>();
            std::cout << nlohmann::json(preprocess_request(request, parse_ctx)).dump(2) << "\n";
            return 0;
        }
        if (opts.preprocess) {
            TextChunk chunk{std::nullopt, opts.text, std::nullopt};
            if (config.language != "auto") chunk.language = config.language;
            std::cout << nlohmann::json(preprocess_chunk(chunk, parse_ctx)).dump(2) << "\n";
            return 0;
        }

        GrammarRegistry grammars;
        if (!opts.grammar_file.empty()) {
            auto custom = std::make_unique<CustomGrammar>(CustomGrammar::from_file(opts.grammar_file));
            std::string name = custom->name();
            grammars.register_grammar(std::move(custom));
            grammars.set_default(name);
        } else {
            grammars.set_default(config.default_grammar);
        }
        const ConcreteGrammar& grammar = opts.grammar.empty() ? grammars.default_grammar() : grammars.get(opts.grammar);

        LinContext lin(registry);
        lin.language = parse_ctx.language;

        if (grammar.name() == "rust-gen") {
            SemanticTree tree = grammar.parse(opts.text, std::nullopt, parse_ctx);
            if (opts.json) std::cout << tree_to_json(tree).dump(2) << "\n";
            else std::cout << grammar.linearize(tree, lin);
            return 0;
        }

        ParseResult result = parse_prose(opts.text, parse_ctx);
        if (opts.json) {
            nlohmann::json out = {{"kind", parse_result_kind_name(result.kind)}};
            nlohmann::json trees = nlohmann::json::array();
            for (const auto& fact : result.facts) trees.push_back(tree_to_json(fact));
            for (const auto& tree : result.partial) trees.push_back(tree_to_json(tree));
            out["trees"] = trees;
            std::cout << out.dump(2) << "\n";
            return 0;
        }
        print_result(result, grammar, lin);
        return 0;
    } catch (const GrammarError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
