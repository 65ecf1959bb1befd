#pragma once

#include <string>

namespace drift {

struct DriftError {
    enum Code {
        IO,
        Parse,
        Schema,
        Config,
        NotFound,
        Duplicate,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    DriftError() = default;
    DriftError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    DriftError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    DriftError(Code c, std::string msg, std::string h, std::string f, int l = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Attach the offending file (and line, if known) to an existing error
    DriftError& at(std::string f, int l = 0);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace drift
