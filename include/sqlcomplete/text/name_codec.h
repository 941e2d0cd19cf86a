#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sqlcomplete {

/// Identifier quoting.
///
/// An identifier is left untouched if it starts with an underscore or a lowercase ASCII letter and continues with
/// underscores, lowercase letters, digits or '$'. Everything else, including the empty string, is wrapped in double
/// quotes. Uppercase letters therefore always force quoting.
struct NameCodec {
    /// Is a name safe to use without quotes?
    static bool IsPlainName(std::string_view name);
    /// Escape a name
    static std::string Escape(std::string_view name);
    /// Strip one pair of surrounding double quotes, embedded quotes are not unescaped
    static std::string Unescape(std::string_view name);
    /// Escape all names
    static std::vector<std::string> EscapeAll(std::span<const std::string> names);
};

}  // namespace sqlcomplete
