#include <svi/error.hpp>

namespace svi {

const char* SviError::code_name(Code c) {
    switch (c) {
        case UnterminatedPlaceholder: return "UnterminatedPlaceholder";
        case UndefinedVariable:       return "UndefinedVariable";
        case RepeatedOpener:          return "RepeatedOpener";
        case IO:                      return "IO";
        case Parse:                   return "Parse";
        case Config:                  return "Config";
        case InvalidArg:              return "InvalidArg";
    }
    return "Unknown";
}

SviError SviError::unterminated(size_t position) {
    SviError e{UnterminatedPlaceholder,
        "no closing delimiter for placeholder at offset " + std::to_string(position),
        "close the placeholder, or write three openers to emit a literal one"};
    e.position = position;
    return e;
}

SviError SviError::undefined_variable(const std::string& key) {
    SviError e{UndefinedVariable,
        "no value found for variable '" + key + "'"};
    e.key = key;
    return e;
}

SviError SviError::repeated_opener(size_t position, const std::string& run) {
    SviError e{RepeatedOpener,
        "found '" + run + "' at offset " + std::to_string(position),
        "use exactly three opener characters to escape a literal delimiter"};
    e.position = position;
    return e;
}

std::string SviError::format() const {
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

} // namespace svi
