#pragma once

#include <flatbuffers/flatbuffer_builder.h>

#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "sqlcomplete/proto/proto_generated.h"
#include "sqlcomplete/scope_resolver.h"

namespace sqlcomplete {

namespace suggestion {

/// Columns of the relations in scope
struct Column {
    /// The relations in scope
    std::vector<ScopeEntry> scope;
    /// Comparison
    bool operator==(const Column& other) const = default;
};
/// Function names
struct Function {
    bool operator==(const Function& other) const = default;
};
/// Table names
struct Table {
    bool operator==(const Table& other) const = default;
};
/// View names
struct View {
    bool operator==(const View& other) const = default;
};
/// Aliases defined in the statement
struct Alias {
    /// The aliases
    std::vector<std::string> aliases;
    /// Comparison
    bool operator==(const Alias& other) const = default;
};
/// Database names
struct Database {
    bool operator==(const Database& other) const = default;
};
/// Keywords
struct Keyword {
    bool operator==(const Keyword& other) const = default;
};
/// Special commands
struct Special {
    bool operator==(const Special& other) const = default;
};

}  // namespace suggestion

/// A typed request for completion candidates
using SuggestionRequest = std::variant<suggestion::Column, suggestion::Function, suggestion::Table, suggestion::View,
                                       suggestion::Alias, suggestion::Database, suggestion::Keyword,
                                       suggestion::Special>;

/// Get the type of a suggestion request
proto::SuggestionType GetSuggestionType(const SuggestionRequest& request);
/// Unpack suggestion requests from a FlatBuffer
std::pair<std::vector<SuggestionRequest>, proto::StatusCode> UnpackSuggestions(const proto::SuggestionList& list);
/// Pack suggestion requests as FlatBuffer
flatbuffers::Offset<proto::SuggestionList> PackSuggestions(flatbuffers::FlatBufferBuilder& builder,
                                                           std::span<const SuggestionRequest> requests);
/// Parse suggestion requests from text.
///
/// Requests are separated by ';' and are written as type[:args].
/// Column scopes are comma-separated table[/alias] entries, aliases are comma-separated names.
/// Example: "column:users/u,orders;alias:u;keyword"
std::pair<std::vector<SuggestionRequest>, proto::StatusCode> ParseSuggestions(std::string_view text);
/// Print suggestion requests in the text format
std::string PrintSuggestions(std::span<const SuggestionRequest> requests);

/// Decides what kind of candidates are expected at the cursor.
/// The classifier inspects the raw query text, it is provided by the host.
class SuggestionClassifier {
   public:
    /// Destructor
    virtual ~SuggestionClassifier() = default;
    /// Classify the cursor context
    virtual std::vector<SuggestionRequest> Classify(std::string_view full_text, std::string_view text_before_cursor) = 0;
};

/// A classifier that returns the same requests for every input.
/// Used by hosts that classify the text on their side.
class StaticClassifier : public SuggestionClassifier {
   protected:
    /// The requests
    std::vector<SuggestionRequest> requests;

   public:
    /// Constructor
    StaticClassifier(std::vector<SuggestionRequest> requests = {}) : requests(std::move(requests)) {}

    /// Replace the requests
    void SetRequests(std::vector<SuggestionRequest> r) { requests = std::move(r); }
    /// Classify the cursor context
    std::vector<SuggestionRequest> Classify(std::string_view full_text, std::string_view text_before_cursor) override;
};

}  // namespace sqlcomplete
