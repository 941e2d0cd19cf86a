#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "sqlcomplete/completion.h"

namespace sqlcomplete {

/// A lazy sequence of matches.
///
/// The candidates are sorted when the sequence is created, matching happens while the sequence is consumed.
/// A sequence is finite and can be consumed only once.
/// It references the candidate strings, they must outlive the sequence.
class MatchSequence {
   protected:
    /// The lower-cased fragment
    std::string fragment;
    /// The fragment length in characters
    uint32_t fragment_length;
    /// Match only at the beginning of a candidate?
    bool anchored;
    /// The candidates in ascending order
    std::vector<std::string_view> candidates;
    /// The next candidate to test
    size_t next_candidate = 0;

   public:
    /// Constructor
    MatchSequence(std::string fragment, std::vector<std::string_view> candidates, bool anchored);
    /// Sequences can't be copied, a copy could be consumed twice
    MatchSequence(const MatchSequence& other) = delete;
    /// Move constructor
    MatchSequence(MatchSequence&& other) = default;

    /// Get the lower-cased fragment
    auto& GetFragment() const { return fragment; }
    /// Is anchored?
    bool IsAnchored() const { return anchored; }
    /// Get the next match
    std::optional<Completion> Next();
    /// Append all remaining matches to a vector, returns the number of matches
    size_t CollectInto(std::vector<Completion>& out);
};

struct Matcher {
    /// Derive the lower-cased fragment from the text before the cursor
    static std::string GetFragment(std::string_view text);
    /// Find completions for the last word of a text.
    /// An anchored match must start at the beginning of a candidate, otherwise the fragment may appear anywhere.
    template <typename Collection>
    static MatchSequence FindMatches(std::string_view text, const Collection& collection, bool anchored = false) {
        std::vector<std::string_view> candidates;
        for (auto& candidate : collection) {
            candidates.emplace_back(candidate);
        }
        return MatchSequence{GetFragment(text), std::move(candidates), anchored};
    }
};

}  // namespace sqlcomplete
