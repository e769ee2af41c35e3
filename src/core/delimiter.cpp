#include <svi/delimiter.hpp>

namespace svi {

Delimiters delimiters(DelimiterStyle style) {
    switch (style) {
        case DelimiterStyle::DoubleBrackets:    return Delimiters{'[', ']'};
        case DelimiterStyle::DoubleCurlyBraces: return Delimiters{'{', '}'};
    }
    return Delimiters{'[', ']'};
}

const char* style_name(DelimiterStyle style) {
    switch (style) {
        case DelimiterStyle::DoubleBrackets:    return "double-brackets";
        case DelimiterStyle::DoubleCurlyBraces: return "double-curly-braces";
    }
    return "unknown";
}

Result<DelimiterStyle> parse_style(const std::string& name) {
    if (name == "double-brackets" || name == "[[]]") {
        return Result<DelimiterStyle>::ok(DelimiterStyle::DoubleBrackets);
    }
    if (name == "double-curly-braces" || name == "{{}}") {
        return Result<DelimiterStyle>::ok(DelimiterStyle::DoubleCurlyBraces);
    }
    return SviError{SviError::Config,
        "unknown delimiter style '" + name + "'",
        "expected \"double-brackets\" or \"double-curly-braces\""};
}

} // namespace svi
