#include "common/debug.hpp"
#include "common/source.hpp"
#include "config/config.hpp"
#include "diagnostics/engine.hpp"
#include "frontend/lexer/lexer.hpp"
#include "frontend/parser/parser.hpp"
#include "frontend/tree/inventory.hpp"
#include "output/printer.hpp"
#include "select/chunker.hpp"
#include "select/selector.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifndef CHEW_VERSION
#define CHEW_VERSION "0.1.0"
#endif

namespace chew {

// コマンドラインオプション
enum class Command { None, Tree, Tokens, Anchors, Chunks, Commands, Labels, Refs, Roundtrip, Help };

struct Options {
    Command command = Command::None;
    std::string input_file;
    std::vector<std::string> selectors;
    std::string config_file;                  // --config=
    std::vector<std::string> extra_verbatim;  // --verbatim=
    bool no_verbatim = false;
    std::optional<size_t> max_depth;
    bool debug = false;
    std::string debug_level = "debug";
};

// ヘルプメッセージを表示
void print_help(const char* program_name) {
    std::cout << "chew v" << CHEW_VERSION << "\n\n";
    std::cout << "Parses a LaTeX file, builds a lossless syntax tree, selects top-level "
                 "elements.\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " <input> tree\n";
    std::cout << "  " << program_name << " <input> tokens\n";
    std::cout << "  " << program_name << " <input> anchors <selector> [<selector>...]\n";
    std::cout << "  " << program_name << " <input> chunks <selector> [<selector>...]\n";
    std::cout << "  " << program_name << " <input> commands | labels | refs\n";
    std::cout << "  " << program_name << " <input> roundtrip\n";
    std::cout << "  " << program_name << " help | --version\n\n";
    std::cout << "<input> is a path, or \"-\" for standard input.\n\n";
    std::cout << "Selectors:\n";
    std::cout << "  \\NAME or m:NAME       command by name\n";
    std::cout << "  {NAME} or e:NAME      environment by name\n";
    std::cout << "  %WORD or c:WORD       comment whose first word is WORD\n\n";
    std::cout << "Options:\n";
    std::cout << "  --config=<file>       read settings from <file> instead of .chew.yml\n";
    std::cout << "  --verbatim=<name>     treat environment <name> as verbatim\n";
    std::cout << "  --no-verbatim         tokenize verbatim environments normally\n";
    std::cout << "  --max-depth=<n>       maximum construct nesting depth\n";
    std::cout << "  --debug, -d           enable debug output\n";
    std::cout << "  -d=<level>            debug level (trace/debug/info/warn/error)\n";
    std::cout << "  --lang=ja             Japanese debug messages\n";
}

// コマンド名を解釈
std::optional<Command> parse_command(const std::string& name) {
    if (name == "tree")
        return Command::Tree;
    if (name == "tokens")
        return Command::Tokens;
    if (name == "anchors")
        return Command::Anchors;
    if (name == "chunks")
        return Command::Chunks;
    if (name == "commands")
        return Command::Commands;
    if (name == "labels")
        return Command::Labels;
    if (name == "refs")
        return Command::Refs;
    if (name == "roundtrip")
        return Command::Roundtrip;
    return std::nullopt;
}

// コマンドラインオプションをパース
Options parse_options(int argc, char* argv[]) {
    Options opts;

    if (argc < 2) {
        opts.command = Command::Help;
        return opts;
    }

    std::string first = argv[1];
    if (first == "help" || first == "--help" || first == "-h") {
        opts.command = Command::Help;
        return opts;
    } else if (first == "--version") {
        std::cout << "chew v" << CHEW_VERSION << "\n";
        std::exit(0);
    }
    opts.input_file = first;

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--debug" || arg == "-d") {
            opts.debug = true;
            debug::set_debug_mode(true);
        } else if (arg.substr(0, 3) == "-d=") {
            opts.debug = true;
            opts.debug_level = arg.substr(3);
            auto level = debug::parse_level(opts.debug_level);
            if (!level) {
                std::cerr << "error: unknown debug level: " << opts.debug_level << "\n";
                std::exit(1);
            }
            debug::set_debug_mode(true);
            debug::set_level(*level);
        } else if (arg == "--lang=ja") {
            debug::set_lang(1);
        } else if (arg.substr(0, 9) == "--config=") {
            opts.config_file = arg.substr(9);
        } else if (arg.substr(0, 11) == "--verbatim=") {
            opts.extra_verbatim.push_back(arg.substr(11));
        } else if (arg == "--no-verbatim") {
            opts.no_verbatim = true;
        } else if (arg.substr(0, 12) == "--max-depth=") {
            std::string value = arg.substr(12);
            if (value.empty() || value.size() > 18 ||
                value.find_first_not_of("0123456789") != std::string::npos ||
                std::stoull(value) == 0) {
                std::cerr << "error: --max-depth needs a positive integer\n";
                std::exit(1);
            }
            opts.max_depth = std::stoull(value);
        } else if (opts.command == Command::None) {
            auto cmd = parse_command(arg);
            if (!cmd) {
                std::cerr << "error: unknown command: " << arg << "\n";
                std::cerr << "run 'chew help' for usage\n";
                std::exit(1);
            }
            opts.command = *cmd;
        } else if (opts.command == Command::Anchors || opts.command == Command::Chunks) {
            // セレクタは "\" や "%" で始まるので、既知のオプション以外はすべてセレクタ
            opts.selectors.push_back(arg);
        } else {
            std::cerr << "error: unexpected argument: " << arg << "\n";
            std::cerr << "run 'chew help' for usage\n";
            std::exit(1);
        }
    }

    return opts;
}

// ファイル（"-" なら標準入力）を読み込む
std::optional<std::string> read_input(const std::string& filename) {
    std::stringstream buffer;
    if (filename == "-") {
        buffer << std::cin.rdbuf();
        return buffer.str();
    }
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    buffer << file.rdbuf();
    return buffer.str();
}

// エラーを診断として表示
int report(const Error& error, const Source& source) {
    diagnostics::DiagnosticEngine engine;
    engine.report(error);
    engine.print(source);
    return 1;
}

int run(const Options& opts) {
    auto content = read_input(opts.input_file);
    if (!content) {
        std::cerr << "error: cannot open file: " << opts.input_file << "\n";
        return 1;
    }
    Source source(std::move(*content), opts.input_file == "-" ? "<stdin>" : opts.input_file);

    // 設定: ファイル → コマンドライン
    config::ConfigLoader loader;
    if (!opts.config_file.empty()) {
        if (!loader.load(opts.config_file)) {
            std::cerr << "error: config: " << loader.error() << "\n";
            return 1;
        }
    } else if (!loader.find_and_load() && !loader.error().empty()) {
        std::cerr << "error: config: " << loader.error() << "\n";
        return 1;
    }

    LexerConfig lexer_config = loader.lexer_config();
    for (const auto& name : opts.extra_verbatim)
        lexer_config.verbatim_environments.push_back(name);
    if (opts.no_verbatim)
        lexer_config.capture_verbatim = false;

    ParserConfig parser_config = loader.parser_config();
    if (opts.max_depth)
        parser_config.max_nesting_depth = *opts.max_depth;

    debug::log(debug::Stage::Cli, debug::Level::Info, "input: " + std::string(source.filename()));

    if (opts.command == Command::Tokens) {
        Lexer lexer(source.content(), Position{}, lexer_config);
        auto tokens = lexer.tokenize();
        if (!tokens)
            return report(tokens.error(), source);
        output::print_tokens(tokens.value(), std::cout);
        return 0;
    }

    // 構文木が必要なコマンドより先にセレクタを検査
    std::vector<select::Selector> selectors;
    if (opts.command == Command::Anchors || opts.command == Command::Chunks) {
        if (opts.selectors.empty()) {
            std::cerr << "error: at least one selector is required\n";
            return 1;
        }
        auto compiled = select::compile_all(opts.selectors);
        if (!compiled)
            return report(compiled.error(), source);
        selectors = std::move(compiled).value();
    }

    Parser parser(source.content(), lexer_config, parser_config);
    auto parsed = parser.parse_document();
    if (!parsed)
        return report(parsed.error(), source);
    const SyntaxTree& tree = parsed.value();

    switch (opts.command) {
        case Command::Tree:
            output::print_tree(tree, std::cout);
            break;
        case Command::Anchors: {
            auto anchors = select::select(tree, tree.body_children(), selectors);
            output::print_anchors(tree, anchors, std::cout);
            break;
        }
        case Command::Chunks: {
            auto anchors = select::select(tree, tree.body_children(), selectors);
            auto chunks = select::compute_chunks(tree, anchors);
            if (!chunks)
                return report(chunks.error(), source);
            output::print_chunks(chunks.value(), std::cout);
            break;
        }
        case Command::Commands:
            output::print_list(commands(tree), std::cout);
            break;
        case Command::Labels:
            output::print_list(labels(tree), std::cout);
            break;
        case Command::Refs:
            output::print_list(references(tree), std::cout);
            break;
        case Command::Roundtrip: {
            std::string rebuilt = tree.to_source();
            std::cout << rebuilt;
            if (rebuilt != source.content()) {
                std::cerr << "error: reconstructed source differs from input\n";
                return 1;
            }
            break;
        }
        default:
            break;
    }
    return 0;
}

}  // namespace chew

int main(int argc, char* argv[]) {
    using namespace chew;

    // オプションをパース
    Options opts = parse_options(argc, argv);

    if (opts.command == Command::Help) {
        print_help(argv[0]);
        return 0;
    }

    if (opts.command == Command::None) {
        std::cerr << "error: no command given\n";
        std::cerr << "run 'chew help' for usage\n";
        return 1;
    }

    return run(opts);
}
