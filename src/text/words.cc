#include "sqlcomplete/text/words.h"

namespace sqlcomplete {

namespace {

constexpr bool isSpace(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f'; }

constexpr bool isWordChar(char c, WordBoundary boundary) {
    if (isSpace(c)) {
        return false;
    }
    switch (boundary) {
        case WordBoundary::ALPHANUM_UNDERSCORE: {
            auto u = static_cast<unsigned char>(c);
            // Non-ascii bytes are treated as letters
            return u >= 128 || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
        }
        case WordBoundary::MANY_PUNCTUATIONS:
            return c != '(' && c != ')' && c != ':' && c != ',';
        case WordBoundary::MOST_PUNCTUATIONS:
            return c != '.' && c != '(' && c != ')' && c != ':' && c != ',';
        case WordBoundary::ALL_PUNCTUATIONS:
            return true;
    }
    return false;
}

}  // namespace

std::string_view LastWord(std::string_view text, WordBoundary boundary) {
    if (text.empty() || isSpace(text.back())) {
        return {};
    }
    size_t begin = text.size();
    for (; begin > 0 && isWordChar(text[begin - 1], boundary); --begin)
        ;
    return text.substr(begin);
}

}  // namespace sqlcomplete
