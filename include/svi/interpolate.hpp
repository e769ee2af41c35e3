#pragma once

#include <svi/delimiter.hpp>
#include <svi/result.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace svi {

using Variables = std::unordered_map<std::string, std::string>;

// A substitution that happened: `value` was written where [[key]] stood.
struct Replacer {
    std::string key;
    std::string value;

    bool operator==(const Replacer& o) const {
        return key == o.key && value == o.value;
    }
    bool operator!=(const Replacer& o) const { return !(*this == o); }
};

// Ordered by first appearance in the input, one entry per key.
using Replacers = std::vector<Replacer>;

// What to do with a placeholder whose key is not in the mapping.
enum class MissingPolicy {
    Fail,  // report UndefinedVariable
    Keep,  // leave the placeholder text untouched
};

struct InterpolateOptions {
    DelimiterStyle style = DelimiterStyle::DoubleBrackets;
    MissingPolicy on_missing = MissingPolicy::Fail;
};

struct Interpolation {
    std::string output;
    Replacers replacers;
};

// Single left-to-right pass over `input`:
//   [[key]]    -> value of key (surrounding whitespace in key is trimmed)
//   [[[ / ]]]  -> literal [[ / ]]
//   [[[[...    -> RepeatedOpener error
// Substituted values are never rescanned. On error no output is returned.
Result<Interpolation> interpolate(const std::string& input,
                                  const Variables& variables,
                                  const InterpolateOptions& options);

Result<Interpolation> interpolate(const std::string& input,
                                  const Variables& variables,
                                  DelimiterStyle style = DelimiterStyle::DoubleBrackets);

} // namespace svi
