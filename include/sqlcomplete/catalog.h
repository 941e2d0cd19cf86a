#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ankerl/unordered_dense.h"
#include "sqlcomplete/proto/proto_generated.h"
#include "sqlcomplete/utils/hash.h"

namespace sqlcomplete {

/// The catalog holds the schema snapshot of a session.
///
/// All names are stored escaped (see NameCodec), relations and functions are keyed by their escaped names.
/// A catalog is reloaded wholesale through Reset() followed by a batch of Extend calls and is read-only while
/// completions are computed. The catalog is not synchronized, the owner must not interleave reloads and reads.
class Catalog {
   public:
    using Version = uint64_t;
    /// A (relation name, column name) pair
    using ColumnRef = std::pair<std::string, std::string>;
    /// A (schema name, function name) pair
    using FunctionRef = std::pair<std::string, std::string>;
    /// The columns of a relation, starting with the "*" sentinel
    using ColumnList = std::vector<std::string>;
    /// The relations of a kind, indexed by the escaped relation name
    using RelationMap = StringMap<ColumnList>;
    /// We don't track any function attributes yet
    struct FunctionInfo {};
    /// The functions, indexed by schema name and function name
    using FunctionMap = StringMap<StringMap<FunctionInfo>>;

    /// The column name that stands for "all columns"
    static constexpr std::string_view COLUMN_SENTINEL = "*";

   protected:
    /// The catalog version.
    /// Every modification bumps the version counter.
    Version version = 1;
    /// The database names in insertion order
    std::vector<std::string> databases;
    /// The tables
    RelationMap tables;
    /// The views
    RelationMap views;
    /// The functions
    FunctionMap functions;
    /// The keywords added on top of the static baseline
    std::vector<std::string> keyword_extensions;
    /// The special commands
    std::vector<std::string> special_commands;
    /// Every literal that dumb completion may offer
    StringSet vocabulary;

    /// Get the relation map of a kind
    RelationMap& GetRelationMap(proto::RelationKind kind) { return kind == proto::RelationKind::VIEW ? views : tables; }
    /// Restore the vocabulary to the static baseline
    void ResetVocabulary();

   public:
    /// Constructor
    Catalog();
    /// Catalogs must not be copied
    Catalog(const Catalog& other) = delete;
    /// Catalogs must not be copy-assigned
    Catalog& operator=(const Catalog& other) = delete;

    /// Get the current version of the catalog
    Version GetVersion() const { return version; }
    /// Get the databases
    auto& GetDatabases() const { return databases; }
    /// Get the relations of a kind
    const RelationMap& GetRelations(proto::RelationKind kind) const {
        return kind == proto::RelationKind::VIEW ? views : tables;
    }
    /// Get the functions
    auto& GetFunctions() const { return functions; }
    /// Get the special commands
    auto& GetSpecialCommands() const { return special_commands; }
    /// Get the vocabulary
    auto& GetVocabulary() const { return vocabulary; }
    /// Get the relation names of a kind
    std::vector<std::string_view> GetRelationNames(proto::RelationKind kind) const;
    /// Get the distinct function names of all schemas
    std::vector<std::string_view> GetFunctionNames() const;
    /// Get the keywords, the static baseline followed by the extensions
    std::vector<std::string_view> GetKeywords() const;
    /// Find the columns of an escaped relation name
    const ColumnList* FindRelation(std::string_view escaped_name, proto::RelationKind kind) const;

    /// Append database names
    void ExtendDatabases(std::span<const std::string> names);
    /// Register relations with unknown columns, a registered relation loses its columns
    void ExtendRelations(std::span<const std::string> names, proto::RelationKind kind);
    /// Append columns to registered relations
    proto::StatusCode ExtendColumns(std::span<const ColumnRef> columns, proto::RelationKind kind);
    /// Register functions
    void ExtendFunctions(std::span<const FunctionRef> functions);
    /// Append keywords
    void ExtendKeywords(std::span<const std::string> keywords);
    /// Append special commands.
    /// Special commands are not part of the vocabulary since they can only appear at the beginning of a line.
    void ExtendSpecialCommands(std::span<const std::string> commands);
    /// Drop all schema metadata
    void Reset();
    /// Reset the catalog and load a schema descriptor.
    /// Keywords and special commands of the descriptor replace the previously added ones.
    proto::StatusCode Load(const proto::SchemaDescriptor& descriptor);
};

}  // namespace sqlcomplete
