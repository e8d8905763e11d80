#include <gitsnip/error.hpp>

namespace gitsnip {

const char* SnipError::code_name(Code c) {
    switch (c) {
        case Validation:   return "Validation";
        case Resolution:   return "Resolution";
        case Fetch:        return "Fetch";
        case FileNotFound: return "FileNotFound";
        case Storage:      return "Storage";
        case Config:       return "Config";
        case Parse:        return "Parse";
        case IO:           return "IO";
        case InvalidArg:   return "InvalidArg";
    }
    return "Unknown";
}

SnipError SnipError::wrap(Code c, const std::string& context) const {
    SnipError out(c, context.empty() ? message : context + ": " + message, hint);
    out.file = file;
    out.line = line;
    return out;
}

std::string SnipError::format() const {
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

} // namespace gitsnip
