#include <globstar/error.hpp>

namespace globstar {

const char* GlobError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Config:     return "Config";
        case Parse:      return "Parse";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string GlobError::format() const {
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
        }
    }

    return result;
}

} // namespace globstar
