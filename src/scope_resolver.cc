#include "sqlcomplete/scope_resolver.h"

#include "sqlcomplete/text/name_codec.h"

namespace sqlcomplete {

const Catalog::ColumnList* ScopeResolver::FindColumns(std::string_view name) const {
    auto escaped = NameCodec::Escape(name);
    // We don't know if the name refers to a table or a view.
    // Tables and views cannot share the same name, so we can check one at a time.
    if (auto* columns = catalog.FindRelation(escaped, proto::RelationKind::TABLE)) {
        return columns;
    }
    return catalog.FindRelation(escaped, proto::RelationKind::VIEW);
}

std::vector<std::string_view> ScopeResolver::ResolveColumns(std::span<const ScopeEntry> scope) const {
    std::vector<std::string_view> columns;
    for (auto& entry : scope) {
        auto* found = FindColumns(entry.reference_name);
        // An alias is not registered in the catalog, fall back to the table it stands for
        if (!found && entry.table_name != entry.reference_name) {
            found = FindColumns(entry.table_name);
        }
        if (!found) {
            continue;
        }
        columns.insert(columns.end(), found->begin(), found->end());
    }
    return columns;
}

}  // namespace sqlcomplete
