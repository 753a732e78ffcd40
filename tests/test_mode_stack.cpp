#include <catch2/catch.hpp>
#include <weft/lang/mode_stack.hpp>

using namespace weft;

static Span at(int line, int col) {
    SourcePos p;
    p.line = line;
    p.col = col;
    return {p, p};
}

TEST_CASE("empty stack defaults to text", "[mode_stack]") {
    ModeStack s;
    REQUIRE(s.empty());
    REQUIRE(s.depth() == 0);
    REQUIRE(s.current_mode() == Mode::text());
}

TEST_CASE("pop on empty stack is a mismatched delimiter", "[mode_stack]") {
    ModeStack s;
    auto r = s.pop(at(3, 7));
    REQUIRE(r.is_err());
    REQUIRE(r.error().kind == LexError::MismatchedDelimiter);
    REQUIRE(r.error().stack.empty());
    REQUIRE(r.error().span.begin.line == 3);
    REQUIRE(r.error().span.begin.col == 7);

    // Still usable afterwards
    REQUIRE(s.pop(at(3, 8)).is_err());
    REQUIRE(s.empty());
}

TEST_CASE("push yields region begin and records the frame", "[mode_stack]") {
    ModeStack s;
    Token t = s.push(Mode::math(), at(1, 4));
    REQUIRE(t.kind == TokenKind::RegionBegin);
    REQUIRE(t.mode == Mode::math());
    REQUIRE(s.current_mode() == Mode::math());
    REQUIRE(s.frames().size() == 1);
    REQUIRE(s.frames()[0].opened_at.begin.col == 4);
}

TEST_CASE("push keeps the call style", "[mode_stack]") {
    ModeStack s;
    Token t = s.push(Mode::command("sec"), at(1, 1), CallStyle::Explicit);
    REQUIRE(t.call == CallStyle::Explicit);
    REQUIRE(s.current_mode() == Mode::command("sec"));
}

TEST_CASE("pop is last-in first-out", "[mode_stack]") {
    ModeStack s;
    s.push(Mode::math(), at(1, 1));
    s.push(Mode::text(), at(1, 5));
    s.push(Mode::command("b"), at(1, 9));

    auto r1 = s.pop(at(2, 1));
    REQUIRE(r1.is_ok());
    REQUIRE(r1.value().kind == TokenKind::RegionEnd);
    REQUIRE(r1.value().mode == Mode::command("b"));
    REQUIRE(s.pop(at(2, 2)).value().mode == Mode::text());
    REQUIRE(s.pop(at(2, 3)).value().mode == Mode::math());
    REQUIRE(s.empty());
    REQUIRE(s.pop(at(2, 4)).is_err());
}

TEST_CASE("close_if_command pops only a command frame", "[mode_stack]") {
    ModeStack s;

    Token none = s.close_if_command(at(1, 1));
    REQUIRE(none.kind == TokenKind::Literal);
    REQUIRE(none.text.empty());

    s.push(Mode::math(), at(1, 1));
    Token still = s.close_if_command(at(1, 2));
    REQUIRE(still.kind == TokenKind::Literal);
    REQUIRE(s.depth() == 1);

    s.push(Mode::command("cmd"), at(1, 3));
    Token closed = s.close_if_command(at(1, 9));
    REQUIRE(closed.kind == TokenKind::RegionEnd);
    REQUIRE(closed.mode == Mode::command("cmd"));
    REQUIRE(s.current_mode() == Mode::math());
}

TEST_CASE("mismatch snapshot is a copy", "[mode_stack]") {
    ModeStack s;
    s.push(Mode::math(), at(1, 1));
    REQUIRE(s.pop(at(1, 2)).is_ok());
    auto r = s.pop(at(1, 3));
    REQUIRE(r.is_err());
    s.push(Mode::text(), at(1, 4));
    REQUIRE(r.error().stack.empty());
}

TEST_CASE("reset empties the stack", "[mode_stack]") {
    ModeStack s;
    s.push(Mode::math(), at(1, 1));
    s.push(Mode::text(), at(1, 2));
    s.reset();
    REQUIRE(s.empty());
    REQUIRE(s.current_mode() == Mode::text());
}
