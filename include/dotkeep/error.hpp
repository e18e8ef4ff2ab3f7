#pragma once

#include <string>

namespace dotkeep {

struct DotkeepError {
    enum Code {
        NoHome,
        IO,
        Parse,
        DuplicateRepo,
        NotFound,
        ScriptNotFound,
        Execution,
        UserDeclined,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    int column = 0;

    DotkeepError() = default;
    DotkeepError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    DotkeepError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    DotkeepError(Code c, std::string msg, std::string h, std::string f,
                 int l, int col = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l), column(col) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace dotkeep
