#pragma once

#include <span>
#include <string_view>

namespace sqlcomplete {

/// The static vocabulary every catalog starts with.
/// The lists are compile-time constants and are shared by all catalogs, catalogs only ever add to a private copy.
struct Vocabulary {
    /// Get the baseline keywords (multi-word keywords such as "GROUP BY" are single entries)
    static std::span<const std::string_view> GetKeywords();
    /// Get the baseline functions
    static std::span<const std::string_view> GetFunctions();
};

}  // namespace sqlcomplete
