#include <catch2/catch.hpp>
#include <weft/lang/lexer.hpp>
#include <weft/result.hpp>
#include <string>

using namespace weft;

// Counts literal tokens, propagating the lexing failure as a WeftError.
static Result<size_t> count_literals(const std::string& source) {
    auto r = lex(source);
    if (r.is_err()) return r.error().to_error();
    size_t n = 0;
    for (const auto& t : r.value()) {
        if (t.kind == TokenKind::Literal) ++n;
    }
    return Result<size_t>::ok(n);
}

static Result<size_t> count_twice(const std::string& a, const std::string& b) {
    auto first = count_literals(a);
    WEFT_TRY(first);
    auto second = count_literals(b);
    WEFT_TRY(second);
    return Result<size_t>::ok(first.value() + second.value());
}

TEST_CASE("Ok result holds its value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(static_cast<bool>(r));
    REQUIRE(r.value() == 42);
}

TEST_CASE("Err result holds its error", "[result]") {
    auto r = Result<int>::err(WeftError{WeftError::IO, "missing file"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == WeftError::IO);
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("Result with a LexError channel", "[result]") {
    LexResult r = LexError::unexpected_end(Region::Math, Span{}, {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().region == Region::Math);

    auto ok = LexResult::ok(Token::literal("x", Span{}));
    REQUIRE(ok.is_ok());
    REQUIRE(ok.value().text == "x");
}

TEST_CASE("map() transforms a token and passes errors through", "[result]") {
    auto ok = LexResult::ok(Token::literal("abc", Span{}));
    auto len = ok.map([](Token& t) { return t.text.size(); });
    REQUIRE(len.is_ok());
    REQUIRE(len.value() == 3);

    LexResult bad = LexError::mismatched_delimiter(Span{}, {});
    bool called = false;
    auto mapped = bad.map([&](Token& t) { called = true; return t.text.size(); });
    REQUIRE(mapped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().kind == LexError::MismatchedDelimiter);
}

TEST_CASE("and_then() chains and short-circuits", "[result]") {
    auto r = Result<int>::ok(5);
    auto chained = r.and_then([](int x) { return Result<int>::ok(x + 10); });
    REQUIRE(chained.value() == 15);

    auto e = Result<int>::err(WeftError{WeftError::Config, "bad"});
    bool called = false;
    auto skipped = e.and_then([&](int x) { called = true; return Result<int>::ok(x); });
    REQUIRE(skipped.is_err());
    REQUIRE_FALSE(called);
}

TEST_CASE("or_else() recovers only from errors", "[result]") {
    auto ok = Result<int>::ok(5);
    REQUIRE(ok.or_else([](WeftError&) { return Result<int>::ok(0); }).value() == 5);

    auto e = Result<int>::err(WeftError{WeftError::IO, "disk"});
    REQUIRE(e.or_else([](WeftError&) { return Result<int>::ok(0); }).value() == 0);
}

TEST_CASE("WEFT_TRY passes through Ok", "[result]") {
    auto r = count_twice("a #b", "|m x|");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 4);
}

TEST_CASE("WEFT_TRY propagates the first failure", "[result]") {
    auto r = count_twice("fine", "\\q");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == WeftError::Lex);
    REQUIRE(r.error().message.find("InvalidEscape(Text)") != std::string::npos);
}

TEST_CASE("Status Ok and Err", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(WeftError{WeftError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == WeftError::Config);
}

TEST_CASE("WeftError format() output", "[error]") {
    WeftError e{WeftError::IO, "file not found", "check the path", "doc.wf", 42};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[IO]: file not found") != std::string::npos);
    REQUIRE(formatted.find("hint: check the path") != std::string::npos);
    REQUIRE(formatted.find("--> doc.wf:42") != std::string::npos);
}

TEST_CASE("WeftError format() without hint or file", "[error]") {
    WeftError e{WeftError::Parse, "unexpected token"};
    auto formatted = e.format();
    REQUIRE(formatted.find("hint:") == std::string::npos);
    REQUIRE(formatted.find("-->") == std::string::npos);
}

TEST_CASE("WeftError format() for a bad argument", "[error]") {
    WeftError e{WeftError::InvalidArg, "unknown argument --sumary",
                "usage: demo_dump <file> [--summary]"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[InvalidArg]: unknown argument --sumary") == 0);
    REQUIRE(formatted.find("hint: usage: demo_dump") != std::string::npos);
    REQUIRE(formatted.find("-->") == std::string::npos);
}

TEST_CASE("WeftError code_name() for all codes", "[error]") {
    REQUIRE(std::string(WeftError::code_name(WeftError::IO)) == "IO");
    REQUIRE(std::string(WeftError::code_name(WeftError::Parse)) == "Parse");
    REQUIRE(std::string(WeftError::code_name(WeftError::Config)) == "Config");
    REQUIRE(std::string(WeftError::code_name(WeftError::Lex)) == "Lex");
    REQUIRE(std::string(WeftError::code_name(WeftError::InvalidArg)) == "InvalidArg");
}
