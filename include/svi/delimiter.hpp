#pragma once

#include <svi/result.hpp>
#include <string>

namespace svi {

// Which bracket pair marks a placeholder.
enum class DelimiterStyle {
    DoubleBrackets,     // [[ name ]]
    DoubleCurlyBraces,  // {{ name }}
};

// Opener and closer are always the same character twice.
struct Delimiters {
    char open;
    char close;

    std::string opener() const { return std::string(2, open); }
    std::string closer() const { return std::string(2, close); }
};

Delimiters delimiters(DelimiterStyle style);

// "double-brackets" / "double-curly-braces"
const char* style_name(DelimiterStyle style);

Result<DelimiterStyle> parse_style(const std::string& name);

} // namespace svi
