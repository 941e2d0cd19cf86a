#include "sqlcomplete/completer.h"

#include <algorithm>

#include "gtest/gtest.h"
#include "sqlcomplete/vocabulary.h"

using namespace sqlcomplete;

namespace {

struct CompleterTest : public ::testing::Test {
    Catalog catalog;
    StaticClassifier classifier;

    void SetUp() override {
        std::vector<std::string> databases{"shop", "Archive"};
        catalog.ExtendDatabases(databases);
        std::vector<std::string> tables{"users", "orders"};
        catalog.ExtendRelations(tables, proto::RelationKind::TABLE);
        std::vector<Catalog::ColumnRef> columns{{"users", "id"},    {"users", "name"},    {"users", "email"},
                                                {"orders", "id"},   {"orders", "total"}, {"orders", "user_id"}};
        ASSERT_EQ(catalog.ExtendColumns(columns, proto::RelationKind::TABLE), proto::StatusCode::OK);
        std::vector<std::string> views{"user_stats"};
        catalog.ExtendRelations(views, proto::RelationKind::VIEW);
        std::vector<Catalog::FunctionRef> functions{{"public", "user_count"}, {"audit", "user_count"}};
        catalog.ExtendFunctions(functions);
        std::vector<std::string> commands{"\\dt", "\\du", "\\q"};
        catalog.ExtendSpecialCommands(commands);
    }

    std::vector<Completion> Complete(std::vector<SuggestionRequest> requests, std::string_view text) {
        classifier.SetRequests(std::move(requests));
        Completer completer{catalog, classifier};
        return completer.Complete(text, text);
    }
};

TEST_F(CompleterTest, ColumnOfAlias) {
    auto completions = Complete({suggestion::Column{{{"users", "u"}}}}, "SELECT na");
    ASSERT_EQ(completions, (std::vector<Completion>{{"name", 2}}));
}

TEST_F(CompleterTest, ColumnsAfterDot) {
    auto completions = Complete({suggestion::Column{{{"users", "u"}}}}, "SELECT u.");
    ASSERT_EQ(completions, (std::vector<Completion>{{"*", 0}, {"email", 0}, {"id", 0}, {"name", 0}}));
}

TEST_F(CompleterTest, ColumnsOfMultipleRelations) {
    auto completions = Complete({suggestion::Column{{{"users", "users"}, {"orders", "o"}}}}, "SELECT id");
    ASSERT_EQ(completions, (std::vector<Completion>{{"id", 2}, {"id", 2}, {"user_id", 2}}));
}

TEST_F(CompleterTest, ColumnsOfTableShadowView) {
    std::vector<std::string> views{"orders"};
    catalog.ExtendRelations(views, proto::RelationKind::VIEW);
    std::vector<Catalog::ColumnRef> view_columns{{"orders", "vtotal"}};
    ASSERT_EQ(catalog.ExtendColumns(view_columns, proto::RelationKind::VIEW), proto::StatusCode::OK);

    auto completions = Complete({suggestion::Column{{{"orders", "o"}}}}, "SELECT o.tot");
    ASSERT_EQ(completions, (std::vector<Completion>{{"total", 3}}));
}

TEST_F(CompleterTest, Tables) {
    auto completions = Complete({suggestion::Table{}}, "SELECT * FROM ers");
    ASSERT_EQ(completions, (std::vector<Completion>{{"orders", 3}, {"users", 3}}));
}

TEST_F(CompleterTest, Views) {
    auto completions = Complete({suggestion::View{}}, "SELECT * FROM stat");
    ASSERT_EQ(completions, (std::vector<Completion>{{"user_stats", 4}}));
}

TEST_F(CompleterTest, FunctionsAreAnchored) {
    ASSERT_EQ(Complete({suggestion::Function{}}, "SELECT user"), (std::vector<Completion>{{"user_count", 4}}));
    ASSERT_TRUE(Complete({suggestion::Function{}}, "SELECT count").empty());
}

TEST_F(CompleterTest, Aliases) {
    auto completions = Complete({suggestion::Alias{{"u", "o", "uo"}}}, "SELECT o");
    ASSERT_EQ(completions, (std::vector<Completion>{{"o", 1}, {"uo", 1}}));
}

TEST_F(CompleterTest, Databases) {
    auto completions = Complete({suggestion::Database{}}, "USE ar");
    ASSERT_EQ(completions, (std::vector<Completion>{{"\"Archive\"", 2}}));
}

TEST_F(CompleterTest, Keywords) {
    auto completions = Complete({suggestion::Keyword{}}, "SELECT * FROM users gro");
    ASSERT_EQ(completions, (std::vector<Completion>{{"GROUP BY", 3}}));
}

TEST_F(CompleterTest, SpecialCommands) {
    auto completions = Complete({suggestion::Special{}}, "\\d");
    ASSERT_EQ(completions, (std::vector<Completion>{{"\\dt", 2}, {"\\du", 2}}));
}

TEST_F(CompleterTest, RequestOrderIsKept) {
    auto completions = Complete({suggestion::Table{}, suggestion::Alias{{"us"}}}, "SELECT us");
    ASSERT_EQ(completions, (std::vector<Completion>{{"users", 2}, {"us", 2}}));
}

TEST_F(CompleterTest, NoRequests) { ASSERT_TRUE(Complete({}, "SELECT ").empty()); }

TEST_F(CompleterTest, DumbCompletion) {
    classifier.SetRequests({suggestion::Keyword{}});
    Completer completer{catalog, classifier, CompleterOptions{.smart_completion = false}};
    auto completions = completer.Complete("SELECT * FROM us", "SELECT * FROM us");
    ASSERT_EQ(completions,
              (std::vector<Completion>{
                  {"USE", 2}, {"USER", 2}, {"user_count", 2}, {"user_id", 2}, {"user_stats", 2}, {"users", 2}}));

    // The per-call flag wins over the configured default
    completions = completer.Complete("SELECT * FROM us", "SELECT * FROM us", true);
    ASSERT_TRUE(completions.empty());
}

TEST_F(CompleterTest, DumbCompletionAfterReset) {
    catalog.Reset();
    Completer completer{catalog, classifier, CompleterOptions{.smart_completion = false}};
    auto completions = completer.Complete("", "");

    std::vector<std::string> expected;
    for (auto keyword : Vocabulary::GetKeywords()) {
        expected.emplace_back(keyword);
    }
    for (auto function : Vocabulary::GetFunctions()) {
        expected.emplace_back(function);
    }
    std::sort(expected.begin(), expected.end());
    expected.erase(std::unique(expected.begin(), expected.end()), expected.end());

    std::vector<std::string> have;
    for (auto& completion : completions) {
        ASSERT_EQ(completion.delete_back_count, 0);
        have.push_back(completion.text);
    }
    ASSERT_EQ(have, expected);
}

TEST_F(CompleterTest, Trace) {
    classifier.SetRequests({suggestion::Column{{{"users", "u"}}}});
    Completer completer{catalog, classifier, CompleterOptions{.trace = true}};
    ::testing::internal::CaptureStdout();
    auto completions = completer.Complete("SELECT na", "SELECT na");
    auto out = ::testing::internal::GetCapturedStdout();
    ASSERT_EQ(completions.size(), 1);
    ASSERT_NE(out.find("COLUMN"), std::string::npos);
    ASSERT_NE(out.find("(users, u)"), std::string::npos);
}

}  // namespace
