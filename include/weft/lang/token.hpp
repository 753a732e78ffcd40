#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace weft {

// Source position for error reporting
struct SourcePos {
    size_t offset = 0;
    int line = 1;
    int col = 1;
};

// Half-open byte range [begin.offset, end.offset)
struct Span {
    SourcePos begin;
    SourcePos end;
};

// Kind of an open lexical region
enum class ModeKind {
    Text,
    Math,
    Command
};

struct Mode {
    ModeKind kind = ModeKind::Text;
    std::string name;  // Command only

    static Mode text() { return {ModeKind::Text, ""}; }
    static Mode math() { return {ModeKind::Math, ""}; }
    static Mode command(std::string n) { return {ModeKind::Command, std::move(n)}; }

    bool is_command() const { return kind == ModeKind::Command; }

    bool operator==(const Mode& o) const { return kind == o.kind && name == o.name; }
    bool operator!=(const Mode& o) const { return !(*this == o); }
};

// A mode paired with where it was opened (diagnostics only)
struct ModeFrame {
    Mode mode;
    Span opened_at;
};

enum class TokenKind {
    RegionBegin,
    RegionEnd,
    Literal,
    ParagraphBreak,
    Comment,
    Eof
};

// How a command region was opened
enum class CallStyle {
    None,
    Explicit,  // |NAME->
    Implicit   // |NAME
};

struct Token {
    TokenKind kind = TokenKind::Eof;
    Mode mode;                // RegionBegin / RegionEnd
    std::string text;         // Literal / Comment
    int blank_lines = 0;      // ParagraphBreak
    CallStyle call = CallStyle::None;
    Span span;

    static Token region_begin(Mode m, Span s, CallStyle c = CallStyle::None);
    static Token region_end(Mode m, Span s);
    static Token literal(std::string t, Span s);
    static Token paragraph_break(int n, Span s);
    static Token comment(std::string t, Span s);
    static Token eof(Span s);
};

const char* token_kind_name(TokenKind k);
const char* mode_kind_name(ModeKind k);

// "Text", "Math" or "Command(name)"
std::string mode_name(const Mode& m);

// One-line rendering such as `Literal("x ")` or `RegionBegin(Math)`
std::string describe(const Token& t);

} // namespace weft
