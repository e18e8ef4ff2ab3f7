#include <dotkeep/error.hpp>

namespace dotkeep {

const char* DotkeepError::code_name(Code c) {
    switch (c) {
        case NoHome:         return "NoHome";
        case IO:             return "IO";
        case Parse:          return "Parse";
        case DuplicateRepo:  return "DuplicateRepo";
        case NotFound:       return "NotFound";
        case ScriptNotFound: return "ScriptNotFound";
        case Execution:      return "Execution";
        case UserDeclined:   return "UserDeclined";
        case InvalidArg:     return "InvalidArg";
    }
    return "Unknown";
}

std::string DotkeepError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
            if (column > 0) {
                result += ":";
                result += std::to_string(column);
            }
        }
    }

    return result;
}

} // namespace dotkeep
