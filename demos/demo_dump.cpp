#include <weft/config.hpp>
#include <weft/lang/lexer.hpp>
#include <weft/log.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace weft;

static Result<std::string> read_source(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        return WeftError{WeftError::IO, "cannot open " + path};
    }
    std::ostringstream ss;
    ss << f.rdbuf();
    return Result<std::string>::ok(ss.str());
}

// Global config if present, then an explicit --config file on top
static Result<Config> load_config(const std::string& explicit_path) {
    std::optional<Config> global;
    std::string global_path = global_config_path();
    if (!global_path.empty() && std::filesystem::exists(global_path)) {
        auto g = Config::load(global_path);
        WEFT_TRY(g);
        global = std::move(g).value();
    }

    std::optional<Config> local;
    if (!explicit_path.empty()) {
        auto l = Config::load(explicit_path);
        WEFT_TRY(l);
        local = std::move(l).value();
    }
    return Result<Config>::ok(Config::effective(global, local));
}

static const char* kUsage = "demo_dump <file> [--config <file.toml>] [--summary]";

struct Options {
    std::string path;
    std::string config_path;
    bool summary_only = false;
};

static Result<Options> parse_args(int argc, char* argv[]) {
    if (argc < 2) {
        return WeftError{WeftError::InvalidArg, "missing input file",
                         std::string("usage: ") + kUsage};
    }
    Options opts;
    opts.path = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return WeftError{WeftError::InvalidArg, "--config needs a file",
                                 std::string("usage: ") + kUsage};
            }
            opts.config_path = argv[++i];
        } else if (arg == "--summary") {
            opts.summary_only = true;
        } else {
            return WeftError{WeftError::InvalidArg, "unknown argument " + arg,
                             std::string("usage: ") + kUsage};
        }
    }
    return Result<Options>::ok(std::move(opts));
}

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (args.is_err()) {
        std::cerr << args.error().format() << "\n";
        return 1;
    }
    const std::string& path = args.value().path;
    bool summary_only = args.value().summary_only;

    auto cfg = load_config(args.value().config_path);
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 1;
    }
    cfg.value().apply_logging();
    const DumpConfig& opts = cfg.value().dump;

    auto source = read_source(path);
    if (source.is_err()) {
        std::cerr << source.error().format() << "\n";
        return 1;
    }

    log::info("lexing %s (%zu bytes)", path.c_str(), source.value().size());

    Lexer lexer(std::move(source).value(), path);
    size_t count = 0;
    size_t comments = 0;
    int depth = 0;
    while (true) {
        auto r = lexer.next_token();
        if (r.is_err()) {
            log::error("lexing stopped after %zu tokens", count);
            std::cerr << r.error().format() << "\n";
            return 1;
        }
        const Token& t = r.value();
        ++count;
        if (t.kind == TokenKind::Comment) ++comments;
        if (t.kind == TokenKind::RegionEnd) --depth;

        bool show = !summary_only && t.kind != TokenKind::Eof &&
                    (opts.comments || t.kind != TokenKind::Comment);
        if (show) {
            if (opts.positions) {
                std::cout << t.span.begin.line << ":" << t.span.begin.col << "\t";
            }
            std::cout << std::string(depth * 2, ' ') << describe(t);
            if (t.call == CallStyle::Explicit) std::cout << "  [explicit]";
            std::cout << "\n";
        }

        if (t.kind == TokenKind::RegionBegin) ++depth;
        if (t.kind == TokenKind::Eof) break;
    }

    std::cout << "--- " << path << ": " << count << " tokens, "
              << comments << " comments\n";
    return 0;
}
