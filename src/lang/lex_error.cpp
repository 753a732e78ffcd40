#include <weft/lang/lex_error.hpp>

namespace weft {

const char* region_name(Region r) {
    switch (r) {
    case Region::Text:    return "Text";
    case Region::Math:    return "Math";
    case Region::Command: return "Command";
    case Region::Comment: return "Comment";
    }
    return "Unknown";
}

Region region_of(ModeKind k) {
    switch (k) {
    case ModeKind::Text:    return Region::Text;
    case ModeKind::Math:    return Region::Math;
    case ModeKind::Command: return Region::Command;
    }
    return Region::Text;
}

const char* LexError::kind_name(Kind k) {
    switch (k) {
    case MismatchedDelimiter:  return "MismatchedDelimiter";
    case InvalidEscape:        return "InvalidEscape";
    case UnexpectedEndOfInput: return "UnexpectedEndOfInput";
    }
    return "Unknown";
}

LexError LexError::mismatched_delimiter(Span span, std::vector<ModeFrame> stack) {
    LexError e;
    e.kind = MismatchedDelimiter;
    e.region = Region::Text;
    e.span = span;
    e.stack = std::move(stack);
    e.message = "'|' closes a region but no region is open";
    return e;
}

LexError LexError::invalid_escape(Region region, char escaped, Span span,
                                  std::vector<ModeFrame> stack) {
    LexError e;
    e.kind = InvalidEscape;
    e.region = region;
    e.span = span;
    e.stack = std::move(stack);
    if (escaped == '\0') {
        e.message = "backslash at end of input";
    } else if (escaped == '\n') {
        e.message = "invalid escape '\\' followed by newline";
    } else {
        e.message = std::string("invalid escape '\\") + escaped + "'";
    }
    e.message += std::string(" in ") + region_name(region) + " mode";
    return e;
}

LexError LexError::unexpected_end(Region region, Span span,
                                  std::vector<ModeFrame> stack) {
    LexError e;
    e.kind = UnexpectedEndOfInput;
    e.region = region;
    e.span = span;
    e.stack = std::move(stack);
    if (region == Region::Comment) {
        e.message = "unterminated comment";
    } else {
        e.message = std::string("input ended inside an open ") +
                    region_name(region) + " region";
    }
    return e;
}

std::string LexError::title() const {
    std::string out = kind_name(kind);
    if (kind != MismatchedDelimiter) {
        out += "(";
        out += region_name(region);
        out += ")";
    }
    return out;
}

static std::string position(const SourcePos& p) {
    return std::to_string(p.line) + ":" + std::to_string(p.col);
}

std::string LexError::format() const {
    std::string result = "error[" + title() + "]: " + message;

    result += "\n  --> ";
    if (!file.empty()) {
        result += file + ":";
    }
    result += position(span.begin);

    if (stack.empty()) {
        result += "\n  note: no region open";
    }
    // Innermost first reads best: "inside X opened at P, inside Y ..."
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        result += "\n  note: inside " + mode_name(it->mode) +
                  " opened at " + position(it->opened_at.begin);
    }
    return result;
}

WeftError LexError::to_error() const {
    std::string hint;
    if (!stack.empty()) {
        const ModeFrame& top = stack.back();
        hint = "innermost open region is " + mode_name(top.mode) +
               " opened at " + position(top.opened_at.begin);
    }
    std::string msg = title() + ": " + message;
    if (!stack.empty()) {
        msg += " (";
        for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
            if (it != stack.rbegin()) msg += ", ";
            msg += "inside " + mode_name(it->mode) + " opened at " +
                   position(it->opened_at.begin);
        }
        msg += ")";
    }
    return WeftError{WeftError::Lex, msg, hint, file, span.begin.line};
}

} // namespace weft
