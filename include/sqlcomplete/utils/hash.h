#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "ankerl/unordered_dense.h"

namespace sqlcomplete {

/// A transparent string hasher.
/// Allows looking up std::string keys with std::string_view without allocating.
struct StringHasher {
    using is_transparent = void;
    using is_avalanching = void;

    size_t operator()(std::string_view s) const { return ankerl::unordered_dense::hash<std::string_view>{}(s); }
};

/// A string-keyed hash map with heterogeneous lookup
template <typename V> using StringMap = ankerl::unordered_dense::map<std::string, V, StringHasher, std::equal_to<>>;
/// A string hash set with heterogeneous lookup
using StringSet = ankerl::unordered_dense::set<std::string, StringHasher, std::equal_to<>>;

}  // namespace sqlcomplete
