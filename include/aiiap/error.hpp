#pragma once

#include <string>

namespace aiiap {

struct AiiapError {
    enum Code {
        IO,
        Parse,
        Config,
        Overlay,
        State,
        NotFound,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    AiiapError() = default;
    AiiapError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    AiiapError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    AiiapError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Multi-line rendering: "error[Code]: message", then hint and location
    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace aiiap
