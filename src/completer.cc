#include "sqlcomplete/completer.h"

#include <sstream>

#include "sqlcomplete/matcher.h"
#include "sqlcomplete/text/words.h"
#include "sqlcomplete/utils/console.h"

namespace sqlcomplete {

namespace {

/// Dispatches a suggestion request to its candidate source.
/// Every request type needs its own overload, a missing one fails to compile.
struct RequestDispatcher {
    /// The catalog
    const Catalog& catalog;
    /// The scope resolver
    const ScopeResolver& scope_resolver;
    /// The word before the cursor
    std::string_view word;
    /// The output
    std::vector<Completion>& out;
    /// Trace the column scopes?
    bool trace;

    void operator()(const suggestion::Column& request) {
        if (trace) {
            std::stringstream msg;
            msg << "completion column scope:";
            for (auto& entry : request.scope) {
                msg << " (" << entry.table_name << ", " << entry.reference_name << ")";
            }
            console::log(msg.str());
        }
        auto columns = scope_resolver.ResolveColumns(request.scope);
        Matcher::FindMatches(word, columns).CollectInto(out);
    }
    void operator()(const suggestion::Function&) {
        auto functions = catalog.GetFunctionNames();
        Matcher::FindMatches(word, functions, true).CollectInto(out);
    }
    void operator()(const suggestion::Table&) {
        auto tables = catalog.GetRelationNames(proto::RelationKind::TABLE);
        Matcher::FindMatches(word, tables).CollectInto(out);
    }
    void operator()(const suggestion::View&) {
        auto views = catalog.GetRelationNames(proto::RelationKind::VIEW);
        Matcher::FindMatches(word, views).CollectInto(out);
    }
    void operator()(const suggestion::Alias& request) { Matcher::FindMatches(word, request.aliases).CollectInto(out); }
    void operator()(const suggestion::Database&) {
        Matcher::FindMatches(word, catalog.GetDatabases()).CollectInto(out);
    }
    void operator()(const suggestion::Keyword&) {
        auto keywords = catalog.GetKeywords();
        Matcher::FindMatches(word, keywords, true).CollectInto(out);
    }
    void operator()(const suggestion::Special&) {
        Matcher::FindMatches(word, catalog.GetSpecialCommands(), true).CollectInto(out);
    }
};

}  // namespace

Completer::Completer(const Catalog& catalog, SuggestionClassifier& classifier, CompleterOptions options)
    : catalog(catalog), classifier(classifier), options(options), scope_resolver(catalog) {}

void Completer::CompleteRequest(const SuggestionRequest& request, std::string_view word,
                                std::vector<Completion>& out) const {
    if (options.trace) {
        std::string msg{"suggestion type: "};
        msg += proto::EnumNameSuggestionType(GetSuggestionType(request));
        console::log(msg);
    }
    std::visit(RequestDispatcher{catalog, scope_resolver, word, out, options.trace}, request);
}

std::vector<Completion> Completer::Complete(std::string_view full_text, std::string_view text_before_cursor,
                                            std::optional<bool> smart_completion) const {
    auto word = WordBeforeCursor(text_before_cursor);
    std::vector<Completion> completions;

    // Without smart completion, match any known name that starts with the word before the cursor
    if (!smart_completion.value_or(options.smart_completion)) {
        Matcher::FindMatches(word, catalog.GetVocabulary(), true).CollectInto(completions);
        return completions;
    }

    for (auto& request : classifier.Classify(full_text, text_before_cursor)) {
        CompleteRequest(request, word, completions);
    }
    return completions;
}

}  // namespace sqlcomplete
