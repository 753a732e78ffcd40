#include <catch2/catch.hpp>
#include <weft/lang/token.hpp>

using namespace weft;

TEST_CASE("mode equality compares command names", "[token]") {
    REQUIRE(Mode::text() == Mode::text());
    REQUIRE(Mode::text() != Mode::math());
    REQUIRE(Mode::command("a") == Mode::command("a"));
    REQUIRE(Mode::command("a") != Mode::command("b"));
    REQUIRE(Mode::command("") != Mode::text());
}

TEST_CASE("mode names", "[token]") {
    REQUIRE(mode_name(Mode::text()) == "Text");
    REQUIRE(mode_name(Mode::math()) == "Math");
    REQUIRE(mode_name(Mode::command("sec 1")) == "Command(sec 1)");
}

TEST_CASE("describe renders payloads", "[token]") {
    Span s;
    REQUIRE(describe(Token::region_begin(Mode::math(), s)) == "RegionBegin(Math)");
    REQUIRE(describe(Token::region_end(Mode::command("x"), s)) == "RegionEnd(Command(x))");
    REQUIRE(describe(Token::paragraph_break(3, s)) == "ParagraphBreak(3)");
    REQUIRE(describe(Token::literal("a\tb\n", s)) == "Literal(\"a\\tb\\n\")");
    REQUIRE(describe(Token::comment("/* \"q\" */", s)) == "Comment(\"/* \\\"q\\\" */\")");
    REQUIRE(describe(Token::eof(s)) == "Eof");
}

TEST_CASE("token kind names", "[token]") {
    REQUIRE(std::string(token_kind_name(TokenKind::ParagraphBreak)) == "ParagraphBreak");
    REQUIRE(std::string(mode_kind_name(ModeKind::Command)) == "Command");
}
