#include "sqlcomplete/suggestion.h"

#include <algorithm>
#include <optional>
#include <sstream>
#include <type_traits>

namespace sqlcomplete {

namespace {

constexpr std::pair<std::string_view, proto::SuggestionType> SUGGESTION_TYPE_NAMES[] = {
    {"column", proto::SuggestionType::COLUMN},   {"function", proto::SuggestionType::FUNCTION},
    {"table", proto::SuggestionType::TABLE},     {"view", proto::SuggestionType::VIEW},
    {"alias", proto::SuggestionType::ALIAS},     {"database", proto::SuggestionType::DATABASE},
    {"keyword", proto::SuggestionType::KEYWORD}, {"special", proto::SuggestionType::SPECIAL},
};

std::string_view trim(std::string_view s) {
    auto is_space = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
    while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
    return s;
}

/// Split a string at a separator, empty parts are dropped
std::vector<std::string_view> split(std::string_view s, char sep) {
    std::vector<std::string_view> parts;
    while (!s.empty()) {
        auto pos = s.find(sep);
        auto part = trim(s.substr(0, pos));
        if (!part.empty()) {
            parts.push_back(part);
        }
        if (pos == std::string_view::npos) {
            break;
        }
        s.remove_prefix(pos + 1);
    }
    return parts;
}

std::optional<SuggestionRequest> makeRequest(proto::SuggestionType type) {
    switch (type) {
        case proto::SuggestionType::COLUMN:
            return suggestion::Column{};
        case proto::SuggestionType::FUNCTION:
            return suggestion::Function{};
        case proto::SuggestionType::TABLE:
            return suggestion::Table{};
        case proto::SuggestionType::VIEW:
            return suggestion::View{};
        case proto::SuggestionType::ALIAS:
            return suggestion::Alias{};
        case proto::SuggestionType::DATABASE:
            return suggestion::Database{};
        case proto::SuggestionType::KEYWORD:
            return suggestion::Keyword{};
        case proto::SuggestionType::SPECIAL:
            return suggestion::Special{};
    }
    return std::nullopt;
}

}  // namespace

proto::SuggestionType GetSuggestionType(const SuggestionRequest& request) {
    // The variant alternatives follow the order of proto::SuggestionType
    static_assert(std::is_same_v<std::variant_alternative_t<0, SuggestionRequest>, suggestion::Column>);
    static_assert(std::is_same_v<std::variant_alternative_t<7, SuggestionRequest>, suggestion::Special>);
    static_assert(static_cast<size_t>(proto::SuggestionType::MAX) + 1 == std::variant_size_v<SuggestionRequest>);
    return static_cast<proto::SuggestionType>(request.index());
}

std::pair<std::vector<SuggestionRequest>, proto::StatusCode> UnpackSuggestions(const proto::SuggestionList& list) {
    std::vector<SuggestionRequest> requests;
    if (!list.requests()) {
        return {std::move(requests), proto::StatusCode::OK};
    }
    auto str = [](const flatbuffers::String* s) { return s ? s->str() : std::string{}; };
    for (auto* packed : *list.requests()) {
        auto maybe_request = makeRequest(packed->suggestion_type());
        if (!maybe_request) {
            return {{}, proto::StatusCode::SUGGESTION_LIST_INVALID};
        }
        auto& request = *maybe_request;
        if (auto* column = std::get_if<suggestion::Column>(&request); column && packed->scope()) {
            for (auto* entry : *packed->scope()) {
                column->scope.push_back(ScopeEntry{str(entry->table_name()), str(entry->reference_name())});
            }
        }
        if (auto* alias = std::get_if<suggestion::Alias>(&request); alias && packed->aliases()) {
            for (auto* name : *packed->aliases()) {
                alias->aliases.push_back(str(name));
            }
        }
        requests.push_back(std::move(request));
    }
    return {std::move(requests), proto::StatusCode::OK};
}

flatbuffers::Offset<proto::SuggestionList> PackSuggestions(flatbuffers::FlatBufferBuilder& builder,
                                                           std::span<const SuggestionRequest> requests) {
    std::vector<flatbuffers::Offset<proto::SuggestionRequest>> packed;
    packed.reserve(requests.size());
    for (auto& request : requests) {
        flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<proto::ScopeEntry>>> scope_ofs;
        flatbuffers::Offset<flatbuffers::Vector<flatbuffers::Offset<flatbuffers::String>>> aliases_ofs;
        if (auto* column = std::get_if<suggestion::Column>(&request)) {
            std::vector<flatbuffers::Offset<proto::ScopeEntry>> scope;
            for (auto& entry : column->scope) {
                scope.push_back(proto::CreateScopeEntry(builder, builder.CreateString(entry.table_name),
                                                        builder.CreateString(entry.reference_name)));
            }
            scope_ofs = builder.CreateVector(scope);
        }
        if (auto* alias = std::get_if<suggestion::Alias>(&request)) {
            aliases_ofs = builder.CreateVectorOfStrings(alias->aliases);
        }
        proto::SuggestionRequestBuilder out{builder};
        out.add_suggestion_type(GetSuggestionType(request));
        out.add_scope(scope_ofs);
        out.add_aliases(aliases_ofs);
        packed.push_back(out.Finish());
    }
    auto requests_ofs = builder.CreateVector(packed);
    proto::SuggestionListBuilder out{builder};
    out.add_requests(requests_ofs);
    return out.Finish();
}

std::pair<std::vector<SuggestionRequest>, proto::StatusCode> ParseSuggestions(std::string_view text) {
    std::vector<SuggestionRequest> requests;
    for (auto item : split(text, ';')) {
        auto colon = item.find(':');
        auto type_name = trim(item.substr(0, colon));
        auto args = colon == std::string_view::npos ? std::string_view{} : trim(item.substr(colon + 1));

        auto type_iter = std::find_if(std::begin(SUGGESTION_TYPE_NAMES), std::end(SUGGESTION_TYPE_NAMES),
                                      [&](auto& entry) { return entry.first == type_name; });
        if (type_iter == std::end(SUGGESTION_TYPE_NAMES)) {
            return {{}, proto::StatusCode::SUGGESTION_LIST_INVALID};
        }
        auto request = *makeRequest(type_iter->second);
        if (auto* column = std::get_if<suggestion::Column>(&request)) {
            for (auto entry : split(args, ',')) {
                auto slash = entry.find('/');
                auto table_name = trim(entry.substr(0, slash));
                auto reference_name = slash == std::string_view::npos ? table_name : trim(entry.substr(slash + 1));
                column->scope.push_back(ScopeEntry{std::string{table_name}, std::string{reference_name}});
            }
        } else if (auto* alias = std::get_if<suggestion::Alias>(&request)) {
            for (auto name : split(args, ',')) {
                alias->aliases.emplace_back(name);
            }
        } else if (!args.empty()) {
            return {{}, proto::StatusCode::SUGGESTION_LIST_INVALID};
        }
        requests.push_back(std::move(request));
    }
    return {std::move(requests), proto::StatusCode::OK};
}

std::string PrintSuggestions(std::span<const SuggestionRequest> requests) {
    std::stringstream out;
    for (size_t i = 0; i < requests.size(); ++i) {
        auto& request = requests[i];
        if (i > 0) {
            out << ";";
        }
        out << SUGGESTION_TYPE_NAMES[request.index()].first;
        if (auto* column = std::get_if<suggestion::Column>(&request); column && !column->scope.empty()) {
            out << ":";
            for (size_t j = 0; j < column->scope.size(); ++j) {
                auto& entry = column->scope[j];
                out << (j > 0 ? "," : "") << entry.table_name;
                if (entry.reference_name != entry.table_name) {
                    out << "/" << entry.reference_name;
                }
            }
        }
        if (auto* alias = std::get_if<suggestion::Alias>(&request); alias && !alias->aliases.empty()) {
            out << ":";
            for (size_t j = 0; j < alias->aliases.size(); ++j) {
                out << (j > 0 ? "," : "") << alias->aliases[j];
            }
        }
    }
    return out.str();
}

std::vector<SuggestionRequest> StaticClassifier::Classify(std::string_view full_text,
                                                          std::string_view text_before_cursor) {
    return requests;
}

}  // namespace sqlcomplete
