#pragma once

#include <cstddef>
#include <string>

namespace svi {

struct SviError {
    enum Code {
        UnterminatedPlaceholder,
        UndefinedVariable,
        RepeatedOpener,
        IO,
        Parse,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    // Interpolation context: the offending variable name (never its value)
    // and the byte offset of the placeholder in the input.
    std::string key;
    size_t position = 0;

    SviError() = default;
    SviError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    SviError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    SviError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    static SviError unterminated(size_t position);
    static SviError undefined_variable(const std::string& key);
    static SviError repeated_opener(size_t position, const std::string& run);

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace svi
