#include <iostream>
#include <string>

#include "gflags/gflags.h"
#include "pugixml.hpp"
#include "sqlcomplete/catalog.h"
#include "sqlcomplete/completer.h"
#include "sqlcomplete/proto/proto_generated.h"
#include "sqlcomplete/suggestion.h"
#include "sqlcomplete/version.h"
#include "sqlcomplete/xml/schema_xml.h"

using namespace sqlcomplete;

DEFINE_string(schema, "", "XML file with a <catalog> schema description");
DEFINE_string(text, "", "The query text");
DEFINE_int32(cursor, -1, "The cursor offset in bytes, defaults to the end of the text");
DEFINE_string(suggest, "", "The expected suggestions, e.g. column:users/u;keyword");
DEFINE_bool(smart, true, "Use the suggestions instead of matching the whole vocabulary");
DEFINE_bool(trace, false, "Log the dispatched suggestions");

int main(int argc, char* argv[]) {
    gflags::SetUsageMessage("Usage: ./sqlcomplete_cli --schema <file> --text <text> [--cursor <offset>] [--suggest <list>]");
    gflags::SetVersionString(std::string{VERSION.text_data, VERSION.text_size});
    gflags::ParseCommandLineFlags(&argc, &argv, true);

    // Load the schema
    Catalog catalog;
    if (!FLAGS_schema.empty()) {
        pugi::xml_document doc;
        if (auto result = doc.load_file(FLAGS_schema.c_str()); !result) {
            std::cerr << "failed to read schema " << FLAGS_schema << ": " << result.description() << std::endl;
            return 1;
        }
        if (auto status = xml::LoadCatalog(doc.child("catalog"), catalog); status != proto::StatusCode::OK) {
            std::cerr << "failed to load schema: " << proto::EnumNameStatusCode(status) << std::endl;
            return 1;
        }
    }

    // Read the suggestions
    auto [requests, status] = ParseSuggestions(FLAGS_suggest);
    if (status != proto::StatusCode::OK) {
        std::cerr << "invalid suggestions: " << FLAGS_suggest << std::endl;
        return 1;
    }

    // Resolve the cursor
    std::string_view text = FLAGS_text;
    size_t cursor = FLAGS_cursor < 0 ? text.size() : static_cast<size_t>(FLAGS_cursor);
    if (cursor > text.size()) {
        std::cerr << "cursor " << cursor << " is out of bounds" << std::endl;
        return 1;
    }

    StaticClassifier classifier{std::move(requests)};
    Completer completer{catalog, classifier, CompleterOptions{.smart_completion = FLAGS_smart, .trace = FLAGS_trace}};
    for (auto& completion : completer.Complete(text, text.substr(0, cursor))) {
        std::cout << completion.text << "\t-" << completion.delete_back_count << std::endl;
    }
    return 0;
}
