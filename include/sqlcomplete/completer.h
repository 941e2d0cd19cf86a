#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "sqlcomplete/catalog.h"
#include "sqlcomplete/completion.h"
#include "sqlcomplete/scope_resolver.h"
#include "sqlcomplete/suggestion.h"

namespace sqlcomplete {

/// The completer options
struct CompleterOptions {
    /// Ask the classifier what is expected at the cursor?
    /// Without smart completion, every known name that starts with the word before the cursor is offered.
    bool smart_completion = true;
    /// Log the suggestion requests?
    bool trace = false;
};

/// Computes the completions at a cursor.
///
/// The completer dispatches every request of the classifier to a candidate source of the catalog.
/// Closed vocabularies (keywords, functions, special commands) only match at the beginning of a word, identifiers
/// match anywhere since the distinguishing part of a name is often at its end.
class Completer {
   protected:
    /// The catalog
    const Catalog& catalog;
    /// The classifier
    SuggestionClassifier& classifier;
    /// The options
    CompleterOptions options;
    /// The scope resolver
    ScopeResolver scope_resolver;

    /// Complete a single request
    void CompleteRequest(const SuggestionRequest& request, std::string_view word, std::vector<Completion>& out) const;

   public:
    /// Constructor
    Completer(const Catalog& catalog, SuggestionClassifier& classifier, CompleterOptions options = {});

    /// Compute the completions.
    /// The smart completion flag overrides the configured default.
    std::vector<Completion> Complete(std::string_view full_text, std::string_view text_before_cursor,
                                     std::optional<bool> smart_completion = std::nullopt) const;
};

}  // namespace sqlcomplete
