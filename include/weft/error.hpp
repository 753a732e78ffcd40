#pragma once

#include <string>

namespace weft {

struct WeftError {
    enum Code {
        IO,
        Parse,
        Config,
        Lex,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    WeftError() = default;
    WeftError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    WeftError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    WeftError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace weft
