#pragma once

#include <svi/interpolate.hpp>
#include <string>

namespace svi {

// The text written in place of a redacted value: "<key>".
std::string mask_for(const std::string& key);

// Masks substituted values in derived text (log lines, error messages).
// Holds only the replacers, never the variable mapping.
//
// Values claim their occurrences in the original text longest first, ties in
// recorded order. A shorter value never takes bytes a longer one claimed, even
// where the two overlap, so no tail of a longer value is left in clear.
// Masks are written once at the end and never rescanned. Empty values are
// ignored.
class Redactor {
public:
    Redactor() = default;
    explicit Redactor(Replacers replacers);

    std::string apply(const std::string& text) const;

    bool empty() const { return replacers_.empty(); }
    size_t size() const { return replacers_.size(); }

private:
    Replacers replacers_;  // sorted by match priority
};

std::string redact(const std::string& text, const Replacers& replacers);

} // namespace svi
