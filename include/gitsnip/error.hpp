#pragma once

#include <string>

namespace gitsnip {

struct SnipError {
    enum Code {
        Validation,
        Resolution,
        Fetch,
        FileNotFound,
        Storage,
        Config,
        Parse,
        IO,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    SnipError() = default;
    SnipError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SnipError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SnipError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Re-tag an error coming out of a lower layer, keeping its text as cause
    SnipError wrap(Code c, const std::string& context) const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace gitsnip
