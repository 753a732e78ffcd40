#include <weft/lang/mode_stack.hpp>
#include <weft/log.hpp>

namespace weft {

Token ModeStack::push(Mode mode, Span span, CallStyle call) {
    if (log::enabled(log::Trace)) {
        log::trace("open %s at %d:%d (depth %zu)", mode_name(mode).c_str(),
                   span.begin.line, span.begin.col, frames_.size() + 1);
    }
    frames_.push_back({mode, span});
    return Token::region_begin(std::move(mode), span, call);
}

LexResult ModeStack::pop(Span span) {
    if (frames_.empty()) {
        return LexError::mismatched_delimiter(span, frames_);
    }
    Mode mode = std::move(frames_.back().mode);
    frames_.pop_back();
    if (log::enabled(log::Trace)) {
        log::trace("close %s at %d:%d (depth %zu)", mode_name(mode).c_str(),
                   span.begin.line, span.begin.col, frames_.size());
    }
    return LexResult::ok(Token::region_end(std::move(mode), span));
}

Token ModeStack::close_if_command(Span span) {
    if (frames_.empty() || !frames_.back().mode.is_command()) {
        return Token::literal("", span);
    }
    // Cannot fail: the stack is non-empty.
    return std::move(pop(span)).value();
}

Mode ModeStack::current_mode() const {
    if (frames_.empty()) return Mode::text();
    return frames_.back().mode;
}

} // namespace weft
