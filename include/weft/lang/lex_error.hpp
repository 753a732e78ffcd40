#pragma once

#include <weft/error.hpp>
#include <weft/lang/token.hpp>
#include <string>
#include <vector>

namespace weft {

// Region in which a lexing failure occurred. Comment is not a mode-stack
// region but is reported like one.
enum class Region {
    Text,
    Math,
    Command,
    Comment
};

// Fatal lexing failure with the full nesting context at the point of failure.
struct LexError {
    enum Kind {
        MismatchedDelimiter,   // pop with an empty mode stack
        InvalidEscape,         // unsupported backslash sequence (Text, Math)
        UnexpectedEndOfInput   // input ended inside a region or comment
    };

    Kind kind = MismatchedDelimiter;
    Region region = Region::Text;
    Span span;
    std::vector<ModeFrame> stack;   // bottom first
    std::string message;
    std::string file;

    static LexError mismatched_delimiter(Span span, std::vector<ModeFrame> stack);
    static LexError invalid_escape(Region region, char escaped, Span span,
                                   std::vector<ModeFrame> stack);
    static LexError unexpected_end(Region region, Span span,
                                   std::vector<ModeFrame> stack);

    // e.g. "UnexpectedEndOfInput(Comment)"
    std::string title() const;

    // Multi-line diagnostic: headline, location, then one line per open region.
    std::string format() const;

    // Wrap into the library-wide error type for callers using Result<T>.
    WeftError to_error() const;

    static const char* kind_name(Kind k);
};

const char* region_name(Region r);

// Region a mode reports errors as
Region region_of(ModeKind k);

} // namespace weft
