#include "sqlcomplete/vocabulary.h"

#include <algorithm>
#include <array>

namespace sqlcomplete {

namespace {

constexpr size_t KEYWORD_COUNT = 0
#define X(NAME) +1
#include "../grammar/lists/sql_keywords.list"
#undef X
    ;

constexpr size_t FUNCTION_COUNT = 0
#define X(NAME) +1
#include "../grammar/lists/sql_functions.list"
#undef X
    ;

constexpr std::array<std::string_view, KEYWORD_COUNT> KEYWORDS{{
#define X(NAME) std::string_view{NAME},
#include "../grammar/lists/sql_keywords.list"
#undef X
}};

constexpr std::array<std::string_view, FUNCTION_COUNT> FUNCTIONS{{
#define X(NAME) std::string_view{NAME},
#include "../grammar/lists/sql_functions.list"
#undef X
}};

static_assert(std::all_of(KEYWORDS.begin(), KEYWORDS.end(), [](std::string_view k) { return !k.empty(); }));

}  // namespace

std::span<const std::string_view> Vocabulary::GetKeywords() { return KEYWORDS; }
std::span<const std::string_view> Vocabulary::GetFunctions() { return FUNCTIONS; }

}  // namespace sqlcomplete
