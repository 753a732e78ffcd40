#include <weft/lang/lexer.hpp>
#include <weft/log.hpp>
#include <cctype>
#include <cstring>

namespace weft {

// ---------------------------------------------------------------------------
// Character classes
// ---------------------------------------------------------------------------

namespace {

// First character of a command name. A '|' not followed by one of these is a
// region close.
bool is_name_start(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_';
}

bool is_name_char(char c) {
    return is_name_start(c) || c == ' ';
}

// Characters that end a verbatim run of text
bool is_reserved(ModeKind mode, char c) {
    switch (mode) {
    case ModeKind::Text:
        return std::strchr("\"${<\n\\#_^}%(", c) != nullptr && c != '\0';
    case ModeKind::Math:
        return std::strchr("\"${\n\\}%(", c) != nullptr && c != '\0';
    case ModeKind::Command:
        return false;
    }
    return false;
}

// Longest run of newlines, each optionally followed by spaces/tabs, that ends
// on a newline and holds at least two of them. Returns the end offset, or 0
// when there is no such run at `pos`.
size_t paragraph_end(const std::string& src, size_t pos, int& newlines) {
    size_t end = 0;
    int count = 0;
    size_t i = pos;
    while (i < src.size() && src[i] == '\n') {
        ++i;
        ++count;
        if (count >= 2) {
            end = i;
            newlines = count;
        }
        while (i < src.size() && (src[i] == ' ' || src[i] == '\t')) ++i;
    }
    return end;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Lexer
// ---------------------------------------------------------------------------

Lexer::Lexer(std::string source, std::string filename)
    : source_(std::move(source)), filename_(std::move(filename)) {}

void Lexer::reset() {
    log::debug("lexer reset: %s", filename_.c_str());
    pos_ = 0;
    line_ = 1;
    col_ = 1;
    modes_.reset();
    comment_depth_ = 0;
    comment_buf_.clear();
    failed_.reset();
    finished_ = false;
}

void Lexer::reset(std::string source, std::string filename) {
    source_ = std::move(source);
    filename_ = std::move(filename);
    reset();
}

LexResult Lexer::next_token() {
    if (failed_) return *failed_;
    if (finished_) return LexResult::ok(Token::eof(span_from(current_pos())));

    switch (modes_.current_mode().kind) {
    case ModeKind::Text:    return scan_text();
    case ModeKind::Math:    return scan_math();
    case ModeKind::Command: return scan_command();
    }
    return scan_text();
}

bool Lexer::starts_with(const char* s) const {
    size_t n = std::strlen(s);
    return source_.compare(pos_, n, s) == 0;
}

// `//`, exactly one character, then a newline
bool Lexer::at_line_comment() const {
    return starts_with("//") && pos_ + 3 < source_.size() &&
           source_[pos_ + 2] != '\n' && source_[pos_ + 3] == '\n';
}

char Lexer::advance() {
    char c = source_[pos_++];
    if (c == '\n') {
        ++line_;
        col_ = 1;
    } else {
        ++col_;
    }
    return c;
}

void Lexer::advance_n(size_t n) {
    while (n-- > 0 && !at_end()) advance();
}

LexResult Lexer::fail(LexError e) {
    e.file = filename_;
    log::debug("lex error at %s:%d:%d: %s", filename_.c_str(),
               e.span.begin.line, e.span.begin.col, e.title().c_str());
    failed_ = e;
    return e;
}

LexResult Lexer::end_of_input(SourcePos start) {
    if (modes_.empty()) {
        finished_ = true;
        return LexResult::ok(Token::eof(span_from(start)));
    }
    Region region = region_of(modes_.current_mode().kind);
    return fail(LexError::unexpected_end(region, span_from(start), modes_.frames()));
}

// ---------------------------------------------------------------------------
// Text region
// ---------------------------------------------------------------------------

LexResult Lexer::scan_text() {
    auto start = current_pos();
    if (at_end()) return end_of_input(start);

    char c = peek();
    switch (c) {
    case '|':
        return lex_pipe(ModeKind::Text, start);
    case '\n': {
        // A blank run is the longer match, even when its first line starts with a tab
        int newlines = 0;
        size_t end = paragraph_end(source_, pos_, newlines);
        if (end != 0) return lex_paragraph_break(start, end, newlines);
        if (peek_at(1) == '\t') return lex_command_line(start);
        return lex_newline(start);
    }
    case '#':
    case '_':
    case '%':
        advance();
        return LexResult::ok(Token::literal(std::string("\\") + c, span_from(start)));
    case '\\':
        return lex_escape(ModeKind::Text, start);
    case '(':
        advance();
        return LexResult::ok(Token::literal("(", span_from(start)));
    default:
        break;
    }

    if (starts_with("/*")) return lex_block_comment(start);
    if (at_line_comment()) return lex_line_comment(start);

    if (is_reserved(ModeKind::Text, c)) {
        advance();
        return LexResult::ok(Token::literal(std::string(1, c), span_from(start)));
    }
    return lex_run(ModeKind::Text, start);
}

// ---------------------------------------------------------------------------
// Math region
// ---------------------------------------------------------------------------

LexResult Lexer::scan_math() {
    auto start = current_pos();
    if (at_end()) return end_of_input(start);

    char c = peek();
    switch (c) {
    case '|':
        return lex_pipe(ModeKind::Math, start);
    case '\n':
        if (peek_at(1) == '\t') return lex_command_line(start);
        return lex_newline(start);
    case '%':
        advance();
        return LexResult::ok(Token::literal("\\%", span_from(start)));
    case '\\':
        return lex_escape(ModeKind::Math, start);
    case '(':
        advance();
        return LexResult::ok(Token::literal("(", span_from(start)));
    default:
        break;
    }

    if (starts_with("/*")) return lex_block_comment(start);
    if (at_line_comment()) return lex_line_comment(start);

    if (is_reserved(ModeKind::Math, c)) {
        advance();
        return LexResult::ok(Token::literal(std::string(1, c), span_from(start)));
    }
    return lex_run(ModeKind::Math, start);
}

// ---------------------------------------------------------------------------
// Command region
// ---------------------------------------------------------------------------

LexResult Lexer::scan_command() {
    auto start = current_pos();
    if (at_end()) return end_of_input(start);

    if (starts_with("/*")) return lex_block_comment(start);
    if (at_line_comment()) return lex_line_comment(start);

    char c = peek();
    if (c == '|') {
        char next = peek_at(1);
        if (next == 'm' || next == 't') {
            advance_n(2);
            if (!at_end() && peek() == ' ') advance();
            Mode mode = next == 'm' ? Mode::math() : Mode::text();
            return LexResult::ok(modes_.push(std::move(mode), span_from(start)));
        }
        if (!is_name_start(next)) {
            advance();
            auto r = modes_.pop(span_from(start));
            if (r.is_err()) return fail(std::move(r).error());
            return r;
        }
        if (starts_with("|END")) {
            advance_n(4);
            return LexResult::ok(modes_.close_if_command(span_from(start)));
        }
    }
    if (c == '\n') return lex_newline(start);

    // Anything else is taken up by the comment scanner and runs until the
    // next matching "*/".
    open_comment("");
    comment_buf_ += advance();
    return scan_comment(start);
}

// ---------------------------------------------------------------------------
// Shared rules
// ---------------------------------------------------------------------------

// Region markers starting with '|' in Text and Math.
LexResult Lexer::lex_pipe(ModeKind mode, SourcePos start) {
    char next = peek_at(1);
    char marker = mode == ModeKind::Math ? 't' : 'm';

    if (next == marker) {
        advance_n(2);
        if (!at_end() && peek() == ' ') advance();
        Mode region = marker == 'm' ? Mode::math() : Mode::text();
        return LexResult::ok(modes_.push(std::move(region), span_from(start)));
    }

    if (!is_name_start(next)) {
        advance();
        auto r = modes_.pop(span_from(start));
        if (r.is_err()) return fail(std::move(r).error());
        return r;
    }

    if (starts_with("|END")) {
        advance_n(4);
        return LexResult::ok(modes_.close_if_command(span_from(start)));
    }

    advance(); // |
    std::string name;
    while (!at_end() && is_name_char(peek())) {
        name += advance();
    }
    CallStyle call = CallStyle::Implicit;
    if (starts_with("->")) {
        advance_n(2);
        call = CallStyle::Explicit;
    }
    return LexResult::ok(modes_.push(Mode::command(std::move(name)),
                                     span_from(start), call));
}

LexResult Lexer::lex_newline(SourcePos start) {
    advance();
    Token tok = modes_.close_if_command(span_from(start));
    if (tok.kind == TokenKind::Literal) {
        tok.text = "\n";
    }
    return LexResult::ok(std::move(tok));
}

// Newline followed by tabs: the next token is read with command rules
// whatever region is open.
LexResult Lexer::lex_command_line(SourcePos start) {
    advance(); // \n
    while (!at_end() && peek() == '\t') advance();
    log::trace("tab-indented command line at %d (from %d:%d)", line_,
               start.line, start.col);
    return scan_command();
}

LexResult Lexer::lex_paragraph_break(SourcePos start, size_t end, int newlines) {
    advance_n(end - pos_);
    return LexResult::ok(Token::paragraph_break(newlines, span_from(start)));
}

LexResult Lexer::lex_escape(ModeKind mode, SourcePos start) {
    advance(); // backslash
    Region region = region_of(mode);
    if (at_end()) {
        return fail(LexError::invalid_escape(region, '\0', span_from(start),
                                             modes_.frames()));
    }

    char c = advance();
    switch (c) {
    case '\\':
    case '{':
    case '}':
    case '$':
    case '&':
    case ' ':
    case '\'':
    case '`':
        return LexResult::ok(Token::literal(std::string("\\") + c, span_from(start)));
    case '"':
        return LexResult::ok(Token::literal("\"", span_from(start)));
    case '_':
        if (mode == ModeKind::Math) {
            return LexResult::ok(Token::literal("\\_", span_from(start)));
        }
        break;
    default:
        break;
    }
    return fail(LexError::invalid_escape(region, c, span_from(start), modes_.frames()));
}

LexResult Lexer::lex_run(ModeKind mode, SourcePos start) {
    std::string text;
    while (!at_end()) {
        char c = peek();
        if (is_reserved(mode, c) || c == '|') break;
        if (c == '/' && at_comment_open()) break;
        text += advance();
    }
    return LexResult::ok(Token::literal(std::move(text), span_from(start)));
}

// ---------------------------------------------------------------------------
// Comments
// ---------------------------------------------------------------------------

void Lexer::open_comment(const char* opener) {
    if (comment_depth_++ == 0) {
        comment_buf_.clear();
    }
    comment_buf_ += opener;
}

Token Lexer::finish_comment(SourcePos start) {
    Token tok = Token::comment(std::move(comment_buf_), span_from(start));
    comment_buf_.clear();
    if (log::enabled(log::Trace)) {
        log::trace("comment %d:%d-%d:%d (%zu bytes)", start.line, start.col,
                   line_, col_, tok.text.size());
    }
    return tok;
}

LexResult Lexer::lex_block_comment(SourcePos start) {
    advance_n(2);
    open_comment("/*");
    return scan_comment(start);
}

LexResult Lexer::lex_line_comment(SourcePos start) {
    advance_n(2);
    open_comment("//");
    comment_buf_ += advance();
    comment_buf_ += advance(); // \n
    --comment_depth_;
    return LexResult::ok(finish_comment(start));
}

LexResult Lexer::scan_comment(SourcePos start) {
    while (!at_end()) {
        if (starts_with("*/")) {
            advance_n(2);
            comment_buf_ += "*/";
            if (--comment_depth_ == 0) {
                return LexResult::ok(finish_comment(start));
            }
            continue;
        }
        if (starts_with("/*")) {
            advance_n(2);
            ++comment_depth_;
            comment_buf_ += "/*";
            continue;
        }
        if (starts_with("\\\"")) {
            advance_n(2);
            comment_buf_ += '"';
            continue;
        }
        comment_buf_ += advance();
    }
    return fail(LexError::unexpected_end(Region::Comment, span_from(start),
                                         modes_.frames()));
}

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

Result<std::vector<Token>, LexError> lex(const std::string& source,
                                         const std::string& filename) {
    Lexer lexer(source, filename);
    std::vector<Token> tokens;
    while (true) {
        auto r = lexer.next_token();
        if (r.is_err()) return std::move(r).error();
        bool eof = r.value().kind == TokenKind::Eof;
        tokens.push_back(std::move(r).value());
        if (eof) break;
    }
    return Result<std::vector<Token>, LexError>::ok(std::move(tokens));
}

} // namespace weft
