#pragma once

#include <string_view>

namespace sqlcomplete {

/// The characters that terminate a word when scanning backwards from the cursor
enum class WordBoundary {
    /// Words consist of letters, digits and underscores only
    ALPHANUM_UNDERSCORE,
    /// Whitespace, parentheses, colons and commas separate words
    MANY_PUNCTUATIONS,
    /// Like MANY_PUNCTUATIONS, but dots separate words as well
    MOST_PUNCTUATIONS,
    /// Only whitespace separates words
    ALL_PUNCTUATIONS,
};

/// Get the last word of a text.
/// Returns an empty word if the text is empty or ends with whitespace.
std::string_view LastWord(std::string_view text, WordBoundary boundary = WordBoundary::ALPHANUM_UNDERSCORE);
/// Get the whitespace-delimited word that ends at the cursor
inline std::string_view WordBeforeCursor(std::string_view text_before_cursor) {
    return LastWord(text_before_cursor, WordBoundary::ALL_PUNCTUATIONS);
}

}  // namespace sqlcomplete
