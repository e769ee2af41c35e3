#include <svi/interpolate.hpp>
#include <svi/log.hpp>
#include <cctype>
#include <unordered_set>

namespace svi {

namespace {

std::string trim(const std::string& s, size_t begin, size_t end) {
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(begin, end - begin);
}

struct Interpolator {
    const std::string& input;
    const Variables& variables;
    InterpolateOptions options;
    Delimiters delims;
    std::string closer;

    size_t pos = 0;
    Interpolation result;
    std::unordered_set<std::string> recorded;

    Interpolator(const std::string& in, const Variables& vars,
                 const InterpolateOptions& opts)
        : input(in), variables(vars), options(opts),
          delims(delimiters(opts.style)), closer(delims.closer()) {}

    bool at_end() const { return pos >= input.size(); }
    char peek() const { return input[pos]; }

    size_t run_length(char c) const {
        size_t n = 0;
        while (pos + n < input.size() && input[pos + n] == c) ++n;
        return n;
    }

    Result<Interpolation> run() {
        result.output.reserve(input.size());

        while (!at_end()) {
            char c = peek();

            if (c == delims.open) {
                auto r = scan_opener();
                if (r.is_err()) return std::move(r).error();
                continue;
            }

            if (c == delims.close) {
                scan_closer();
                continue;
            }

            result.output.push_back(c);
            ++pos;
        }

        log::debug("interpolated %zu placeholder(s) with %s",
                   result.replacers.size(), style_name(options.style));
        return Result<Interpolation>::ok(std::move(result));
    }

    Status scan_opener() {
        size_t n = run_length(delims.open);

        if (n == 1) {
            result.output.push_back(delims.open);
            ++pos;
            return ok_status();
        }

        // Escape: three openers stand for a literal opener sequence.
        if (n == 3) {
            result.output += delims.opener();
            pos += 3;
            return ok_status();
        }

        if (n > 3) {
            return SviError::repeated_opener(pos, input.substr(pos, n));
        }

        return capture_placeholder();
    }

    // Outside a placeholder only an exact run of three closers is special.
    void scan_closer() {
        size_t n = run_length(delims.close);
        if (n == 3) {
            result.output += closer;
        } else {
            result.output.append(input, pos, n);
        }
        pos += n;
    }

    // pos is at a two-character opener. The first closer sequence ends the
    // capture.
    Status capture_placeholder() {
        size_t start = pos;
        size_t end = input.find(closer, start + 2);
        if (end == std::string::npos) {
            return SviError::unterminated(start);
        }

        std::string key = trim(input, start + 2, end);
        pos = end + closer.size();

        auto it = variables.find(key);
        if (it != variables.end()) {
            result.output += it->second;
            if (recorded.insert(key).second) {
                result.replacers.push_back(Replacer{key, it->second});
            }
            log::trace("substituted '%s' at offset %zu", key.c_str(), start);
            return ok_status();
        }

        if (options.on_missing == MissingPolicy::Keep) {
            result.output.append(input, start, pos - start);
            log::trace("kept unresolved '%s' at offset %zu", key.c_str(), start);
            return ok_status();
        }

        return SviError::undefined_variable(key);
    }
};

} // namespace

Result<Interpolation> interpolate(const std::string& input,
                                  const Variables& variables,
                                  const InterpolateOptions& options) {
    Interpolator interp(input, variables, options);
    return interp.run();
}

Result<Interpolation> interpolate(const std::string& input,
                                  const Variables& variables,
                                  DelimiterStyle style) {
    InterpolateOptions options;
    options.style = style;
    return interpolate(input, variables, options);
}

} // namespace svi
