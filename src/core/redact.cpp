#include <svi/redact.hpp>
#include <algorithm>
#include <vector>

namespace svi {

std::string mask_for(const std::string& key) {
    return "<" + key + ">";
}

Redactor::Redactor(Replacers replacers) {
    replacers_.reserve(replacers.size());
    for (auto& r : replacers) {
        if (!r.value.empty()) {
            replacers_.push_back(std::move(r));
        }
    }
    std::stable_sort(replacers_.begin(), replacers_.end(),
                     [](const Replacer& a, const Replacer& b) {
                         return a.value.size() > b.value.size();
                     });
}

std::string Redactor::apply(const std::string& text) const {
    if (replacers_.empty()) return text;

    // Claim byte ranges in priority order; a later (shorter) value may only
    // take bytes no earlier value has claimed.
    std::vector<bool> claimed(text.size(), false);
    std::vector<const Replacer*> starts(text.size(), nullptr);

    for (const auto& r : replacers_) {
        const size_t len = r.value.size();
        size_t pos = text.find(r.value);
        while (pos != std::string::npos) {
            bool unclaimed = std::none_of(claimed.begin() + pos, claimed.begin() + pos + len,
                                          [](bool b) { return b; });
            if (unclaimed) {
                std::fill(claimed.begin() + pos, claimed.begin() + pos + len, true);
                starts[pos] = &r;
                pos = text.find(r.value, pos + len);
            } else {
                pos = text.find(r.value, pos + 1);
            }
        }
    }

    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        if (starts[pos]) {
            out += mask_for(starts[pos]->key);
            pos += starts[pos]->value.size();
        } else {
            out.push_back(text[pos]);
            ++pos;
        }
    }

    return out;
}

std::string redact(const std::string& text, const Replacers& replacers) {
    return Redactor(replacers).apply(text);
}

} // namespace svi
