#pragma once

#include <weft/lang/lex_error.hpp>
#include <weft/lang/token.hpp>
#include <weft/result.hpp>
#include <vector>

namespace weft {

using LexResult = Result<Token, LexError>;

// LIFO record of open regions. An empty stack means top-level Text.
class ModeStack {
public:
    // Open a region. Always succeeds.
    Token push(Mode mode, Span span, CallStyle call = CallStyle::None);

    // Close the innermost region, or MismatchedDelimiter when none is open.
    LexResult pop(Span span);

    // Pops only when the innermost region is a command; otherwise yields an
    // empty literal so a command body stays optional per line.
    Token close_if_command(Span span);

    Mode current_mode() const;

    bool empty() const { return frames_.empty(); }
    size_t depth() const { return frames_.size(); }
    const std::vector<ModeFrame>& frames() const { return frames_; }

    void reset() { frames_.clear(); }

private:
    std::vector<ModeFrame> frames_;
};

} // namespace weft
