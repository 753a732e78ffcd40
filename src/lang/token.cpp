#include <weft/lang/token.hpp>

namespace weft {

Token Token::region_begin(Mode m, Span s, CallStyle c) {
    Token t;
    t.kind = TokenKind::RegionBegin;
    t.mode = std::move(m);
    t.call = c;
    t.span = s;
    return t;
}

Token Token::region_end(Mode m, Span s) {
    Token t;
    t.kind = TokenKind::RegionEnd;
    t.mode = std::move(m);
    t.span = s;
    return t;
}

Token Token::literal(std::string text, Span s) {
    Token t;
    t.kind = TokenKind::Literal;
    t.text = std::move(text);
    t.span = s;
    return t;
}

Token Token::paragraph_break(int n, Span s) {
    Token t;
    t.kind = TokenKind::ParagraphBreak;
    t.blank_lines = n;
    t.span = s;
    return t;
}

Token Token::comment(std::string text, Span s) {
    Token t;
    t.kind = TokenKind::Comment;
    t.text = std::move(text);
    t.span = s;
    return t;
}

Token Token::eof(Span s) {
    Token t;
    t.kind = TokenKind::Eof;
    t.span = s;
    return t;
}

const char* token_kind_name(TokenKind k) {
    switch (k) {
    case TokenKind::RegionBegin:    return "RegionBegin";
    case TokenKind::RegionEnd:      return "RegionEnd";
    case TokenKind::Literal:        return "Literal";
    case TokenKind::ParagraphBreak: return "ParagraphBreak";
    case TokenKind::Comment:        return "Comment";
    case TokenKind::Eof:            return "Eof";
    }
    return "Unknown";
}

const char* mode_kind_name(ModeKind k) {
    switch (k) {
    case ModeKind::Text:    return "Text";
    case ModeKind::Math:    return "Math";
    case ModeKind::Command: return "Command";
    }
    return "Unknown";
}

std::string mode_name(const Mode& m) {
    std::string out = mode_kind_name(m.kind);
    if (m.is_command()) {
        out += "(" + m.name + ")";
    }
    return out;
}

static std::string quoted(const std::string& s) {
    std::string out = "\"";
    for (char c : s) {
        switch (c) {
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        default:   out += c; break;
        }
    }
    out += "\"";
    return out;
}

std::string describe(const Token& t) {
    std::string out = token_kind_name(t.kind);
    switch (t.kind) {
    case TokenKind::RegionBegin:
    case TokenKind::RegionEnd:
        out += "(" + mode_name(t.mode) + ")";
        break;
    case TokenKind::Literal:
    case TokenKind::Comment:
        out += "(" + quoted(t.text) + ")";
        break;
    case TokenKind::ParagraphBreak:
        out += "(" + std::to_string(t.blank_lines) + ")";
        break;
    case TokenKind::Eof:
        break;
    }
    return out;
}

} // namespace weft
