#include "sqlcomplete/catalog.h"

#include <initializer_list>
#include <iterator>

#include "sqlcomplete/proto/proto_generated.h"
#include "sqlcomplete/text/name_codec.h"
#include "sqlcomplete/utils/console.h"
#include "sqlcomplete/vocabulary.h"

using namespace sqlcomplete;

namespace {

template <typename Fn> void forEachString(const flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>>* strings,
                                          Fn fn) {
    if (!strings) {
        return;
    }
    for (auto* s : *strings) {
        fn(s == nullptr ? std::string{} : s->str());
    }
}

}  // namespace

Catalog::Catalog() { ResetVocabulary(); }

void Catalog::ResetVocabulary() {
    vocabulary.clear();
    for (auto keyword : Vocabulary::GetKeywords()) {
        vocabulary.emplace(keyword);
    }
    for (auto function : Vocabulary::GetFunctions()) {
        vocabulary.emplace(function);
    }
}

std::vector<std::string_view> Catalog::GetRelationNames(proto::RelationKind kind) const {
    auto& relations = GetRelations(kind);
    std::vector<std::string_view> names;
    names.reserve(relations.size());
    for (auto& [name, columns] : relations) {
        names.push_back(name);
    }
    return names;
}

std::vector<std::string_view> Catalog::GetFunctionNames() const {
    ankerl::unordered_dense::set<std::string_view> names;
    for (auto& [schema, schema_functions] : functions) {
        for (auto& [name, info] : schema_functions) {
            names.insert(name);
        }
    }
    return {names.begin(), names.end()};
}

std::vector<std::string_view> Catalog::GetKeywords() const {
    auto baseline = Vocabulary::GetKeywords();
    std::vector<std::string_view> keywords;
    keywords.reserve(baseline.size() + keyword_extensions.size());
    keywords.insert(keywords.end(), baseline.begin(), baseline.end());
    keywords.insert(keywords.end(), keyword_extensions.begin(), keyword_extensions.end());
    return keywords;
}

const Catalog::ColumnList* Catalog::FindRelation(std::string_view escaped_name, proto::RelationKind kind) const {
    auto& relations = GetRelations(kind);
    if (auto iter = relations.find(escaped_name); iter != relations.end()) {
        return &iter->second;
    }
    return nullptr;
}

void Catalog::ExtendDatabases(std::span<const std::string> names) {
    auto escaped = NameCodec::EscapeAll(names);
    databases.insert(databases.end(), std::make_move_iterator(escaped.begin()), std::make_move_iterator(escaped.end()));
    ++version;
}

void Catalog::ExtendRelations(std::span<const std::string> names, proto::RelationKind kind) {
    auto& relations = GetRelationMap(kind);
    for (auto& name : names) {
        auto escaped = NameCodec::Escape(name);
        relations.insert_or_assign(escaped, ColumnList{std::string{COLUMN_SENTINEL}});
        vocabulary.insert(std::move(escaped));
    }
    ++version;
}

proto::StatusCode Catalog::ExtendColumns(std::span<const ColumnRef> columns, proto::RelationKind kind) {
    auto& relations = GetRelationMap(kind);

    // Resolve all relations first, a failing batch must not leave half of its columns behind
    std::vector<std::pair<ColumnList*, std::string>> resolved;
    resolved.reserve(columns.size());
    for (auto& [relation_name, column_name] : columns) {
        auto iter = relations.find(NameCodec::Escape(relation_name));
        if (iter == relations.end()) {
            return proto::StatusCode::CATALOG_RELATION_UNKNOWN;
        }
        resolved.emplace_back(&iter->second, NameCodec::Escape(column_name));
    }
    for (auto& [relation_columns, column_name] : resolved) {
        relation_columns->push_back(column_name);
        vocabulary.insert(std::move(column_name));
    }
    ++version;
    return proto::StatusCode::OK;
}

void Catalog::ExtendFunctions(std::span<const FunctionRef> refs) {
    for (auto& [schema_name, function_name] : refs) {
        auto escaped_function = NameCodec::Escape(function_name);
        functions[NameCodec::Escape(schema_name)].insert_or_assign(escaped_function, FunctionInfo{});
        vocabulary.insert(std::move(escaped_function));
    }
    ++version;
}

void Catalog::ExtendKeywords(std::span<const std::string> keywords) {
    for (auto& keyword : keywords) {
        keyword_extensions.push_back(keyword);
        vocabulary.insert(keyword);
    }
    ++version;
}

void Catalog::ExtendSpecialCommands(std::span<const std::string> commands) {
    special_commands.insert(special_commands.end(), commands.begin(), commands.end());
    ++version;
}

void Catalog::Reset() {
    databases.clear();
    tables.clear();
    views.clear();
    functions.clear();
    ResetVocabulary();
    ++version;
}

proto::StatusCode Catalog::Load(const proto::SchemaDescriptor& descriptor) {
    // Check the relations before touching the catalog
    if (auto* relations = descriptor.relations()) {
        for (auto* relation : *relations) {
            if (!relation->relation_name() || relation->relation_name()->size() == 0) {
                console::log("schema descriptor contains a relation without a name");
                return proto::StatusCode::CATALOG_DESCRIPTOR_RELATION_NAME_EMPTY;
            }
            // Verification does not check enum ranges
            auto kind = relation->relation_kind();
            if (kind != proto::RelationKind::TABLE && kind != proto::RelationKind::VIEW) {
                console::log("schema descriptor contains a relation of unknown kind");
                return proto::StatusCode::CATALOG_DESCRIPTOR_INVALID;
            }
        }
    }
    Reset();
    keyword_extensions.clear();
    special_commands.clear();

    std::vector<std::string> names;
    forEachString(descriptor.databases(), [&](std::string name) { names.push_back(std::move(name)); });
    ExtendDatabases(names);

    // Register all relations before their columns
    if (auto* relations = descriptor.relations()) {
        std::vector<ColumnRef> columns;
        for (auto kind : {proto::RelationKind::TABLE, proto::RelationKind::VIEW}) {
            names.clear();
            columns.clear();
            for (auto* relation : *relations) {
                if (relation->relation_kind() != kind) {
                    continue;
                }
                auto relation_name = relation->relation_name()->str();
                names.push_back(relation_name);
                forEachString(relation->columns(),
                              [&](std::string column) { columns.emplace_back(relation_name, std::move(column)); });
            }
            ExtendRelations(names, kind);
            if (auto status = ExtendColumns(columns, kind); status != proto::StatusCode::OK) {
                return status;
            }
        }
    }

    if (auto* refs = descriptor.functions()) {
        std::vector<FunctionRef> function_refs;
        function_refs.reserve(refs->size());
        for (auto* ref : *refs) {
            function_refs.emplace_back(ref->schema_name() ? ref->schema_name()->str() : std::string{},
                                       ref->function_name() ? ref->function_name()->str() : std::string{});
        }
        ExtendFunctions(function_refs);
    }

    names.clear();
    forEachString(descriptor.keywords(), [&](std::string keyword) { names.push_back(std::move(keyword)); });
    ExtendKeywords(names);

    names.clear();
    forEachString(descriptor.special_commands(), [&](std::string command) { names.push_back(std::move(command)); });
    ExtendSpecialCommands(names);
    return proto::StatusCode::OK;
}
