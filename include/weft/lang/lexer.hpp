#pragma once

#include <weft/lang/lex_error.hpp>
#include <weft/lang/mode_stack.hpp>
#include <weft/lang/token.hpp>
#include <weft/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace weft {

// Pull lexer over one source buffer. Each next_token() call runs the scanner
// for the innermost open region (Text when none is open) and returns exactly
// one token or the error that ends the pass.
//
// A Lexer owns all mutable state of its pass (mode stack, comment nesting),
// so independent passes need independent instances.
class Lexer {
public:
    explicit Lexer(std::string source, std::string filename = "<input>");

    LexResult next_token();

    // Rewind to the start of the current source and clear all state.
    void reset();
    // Switch to a new source and clear all state.
    void reset(std::string source, std::string filename = "<input>");

    const ModeStack& modes() const { return modes_; }
    int comment_depth() const { return comment_depth_; }
    SourcePos position() const { return {pos_, line_, col_}; }
    const std::string& filename() const { return filename_; }

private:
    LexResult scan_text();
    LexResult scan_math();
    LexResult scan_command();
    LexResult scan_comment(SourcePos start);

    LexResult lex_pipe(ModeKind mode, SourcePos start);
    LexResult lex_newline(SourcePos start);
    LexResult lex_command_line(SourcePos start);
    LexResult lex_paragraph_break(SourcePos start, size_t end, int newlines);
    LexResult lex_escape(ModeKind mode, SourcePos start);
    LexResult lex_block_comment(SourcePos start);
    LexResult lex_line_comment(SourcePos start);
    LexResult lex_run(ModeKind mode, SourcePos start);
    LexResult end_of_input(SourcePos start);

    void open_comment(const char* opener);
    Token finish_comment(SourcePos start);

    bool at_end() const { return pos_ >= source_.size(); }
    char peek() const { return source_[pos_]; }
    char peek_at(size_t n) const {
        return (pos_ + n < source_.size()) ? source_[pos_ + n] : '\0';
    }
    bool starts_with(const char* s) const;
    bool at_line_comment() const;
    bool at_comment_open() const { return starts_with("/*") || at_line_comment(); }
    char advance();
    void advance_n(size_t n);

    SourcePos current_pos() const { return {pos_, line_, col_}; }
    Span span_from(SourcePos start) const { return {start, current_pos()}; }

    LexResult fail(LexError e);

    std::string source_;
    std::string filename_;
    size_t pos_ = 0;
    int line_ = 1;
    int col_ = 1;

    ModeStack modes_;
    int comment_depth_ = 0;
    std::string comment_buf_;

    std::optional<LexError> failed_;
    bool finished_ = false;
};

// Lex a whole buffer. The returned vector always ends with an Eof token.
Result<std::vector<Token>, LexError> lex(const std::string& source,
                                         const std::string& filename = "<input>");

} // namespace weft
