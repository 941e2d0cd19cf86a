#include "sqlcomplete/matcher.h"

#include <algorithm>

#include "sqlcomplete/text/utf8.h"
#include "sqlcomplete/text/words.h"
#include "sqlcomplete/utils/string_conversion.h"

namespace sqlcomplete {

MatchSequence::MatchSequence(std::string fragment, std::vector<std::string_view> candidates, bool anchored)
    : fragment(std::move(fragment)),
      fragment_length(static_cast<uint32_t>(utf8::countCodepoints(this->fragment))),
      anchored(anchored),
      candidates(std::move(candidates)) {
    std::sort(this->candidates.begin(), this->candidates.end());
}

std::optional<Completion> MatchSequence::Next() {
    fuzzy_ci_string_view ci_fragment{fragment.data(), fragment.size()};
    while (next_candidate < candidates.size()) {
        auto candidate = candidates[next_candidate++];
        fuzzy_ci_string_view ci_candidate{candidate.data(), candidate.size()};
        bool matches = anchored ? ci_candidate.starts_with(ci_fragment)
                                : ci_candidate.find(ci_fragment) != fuzzy_ci_string_view::npos;
        if (matches) {
            return Completion{std::string{candidate}, fragment_length};
        }
    }
    return std::nullopt;
}

size_t MatchSequence::CollectInto(std::vector<Completion>& out) {
    size_t n = 0;
    while (auto next = Next()) {
        out.push_back(std::move(*next));
        ++n;
    }
    return n;
}

std::string Matcher::GetFragment(std::string_view text) {
    return lowercase_fuzzy(LastWord(text, WordBoundary::MOST_PUNCTUATIONS));
}

}  // namespace sqlcomplete
