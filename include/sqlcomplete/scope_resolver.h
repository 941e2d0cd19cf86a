#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "sqlcomplete/catalog.h"

namespace sqlcomplete {

/// A relation that is visible at the cursor
struct ScopeEntry {
    /// The table name
    std::string table_name;
    /// The name the user wrote, either the table name or an alias
    std::string reference_name;

    /// Comparison
    bool operator==(const ScopeEntry& other) const = default;
};

/// Resolves the relations in scope to their columns
class ScopeResolver {
   protected:
    /// The catalog
    const Catalog& catalog;

    /// Find the columns of a relation, tables shadow views with the same name
    const Catalog::ColumnList* FindColumns(std::string_view name) const;

   public:
    /// Constructor
    explicit ScopeResolver(const Catalog& catalog) : catalog(catalog) {}

    /// Collect the columns of all relations in scope.
    /// Columns keep the scope order and are not deduplicated, relations that can't be found contribute nothing.
    /// The returned names point into the catalog.
    std::vector<std::string_view> ResolveColumns(std::span<const ScopeEntry> scope) const;
};

}  // namespace sqlcomplete
