// demo_errors.cpp
//
// Lexes a handful of broken inputs and prints the diagnostic for each, so the
// full error rendering (location plus every open region) can be eyeballed:
//
//     ./demo_errors            # built-in samples
//     ./demo_errors --trace    # same, with the lexer's trace log and the
//                              # multi-line diagnostic on stderr

#include <weft/lang/lexer.hpp>
#include <weft/log.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace weft;

struct Sample {
    const char* name;
    const char* source;
};

static const std::vector<Sample>& samples() {
    static const std::vector<Sample> table = {
        {"stray close",          "plain text|"},
        {"bad escape in text",   "cost \\q"},
        {"bad escape in math",   "|m x \\n|"},
        {"unterminated math",    "intro |m a + b"},
        {"unterminated comment", "|m x /* open /* nested */ still open"},
        {"prose in command",     "|section->|t Title| trailing\n"},
    };
    return table;
}

// Lexes to completion; failures come back as the library-wide error type.
static Result<size_t> count_tokens(const std::string& source, const std::string& name) {
    auto r = lex(source, name);
    if (r.is_err()) {
        log::debug("%s", r.error().format().c_str());
        return r.error().to_error();
    }
    return Result<size_t>::ok(r.value().size());
}

int main(int argc, char** argv) {
    if (argc > 1 && std::string(argv[1]) == "--trace") {
        log::set_level(log::Trace);
    }

    int failures = 0;
    for (const auto& s : samples()) {
        log::info("sample: %s", s.name);
        auto r = count_tokens(s.source, s.name);
        if (r.is_ok()) {
            std::cout << s.name << ": " << r.value() << " tokens\n";
        } else {
            ++failures;
            std::cout << r.error().format() << "\n\n";
        }
    }

    log::info("%d of %zu samples failed to lex", failures, samples().size());
    return 0;
}
