#include "sqlcomplete/scope_resolver.h"

#include "gtest/gtest.h"

using namespace sqlcomplete;

namespace {

struct ScopeResolverTest : public ::testing::Test {
    Catalog catalog;

    void SetUp() override {
        std::vector<std::string> tables{"orders", "products", "Users"};
        catalog.ExtendRelations(tables, proto::RelationKind::TABLE);
        std::vector<Catalog::ColumnRef> columns{
            {"orders", "id"}, {"orders", "total"}, {"products", "id"}, {"products", "price"}, {"Users", "name"}};
        ASSERT_EQ(catalog.ExtendColumns(columns, proto::RelationKind::TABLE), proto::StatusCode::OK);
        std::vector<std::string> views{"active_orders"};
        catalog.ExtendRelations(views, proto::RelationKind::VIEW);
        std::vector<Catalog::ColumnRef> view_columns{{"active_orders", "id"}};
        ASSERT_EQ(catalog.ExtendColumns(view_columns, proto::RelationKind::VIEW), proto::StatusCode::OK);
    }
};

TEST_F(ScopeResolverTest, SingleTable) {
    ScopeResolver resolver{catalog};
    std::vector<ScopeEntry> scope{{"orders", "orders"}};
    ASSERT_EQ(resolver.ResolveColumns(scope), (std::vector<std::string_view>{"*", "id", "total"}));
}

TEST_F(ScopeResolverTest, ConcatenatesWithoutDeduplication) {
    ScopeResolver resolver{catalog};
    std::vector<ScopeEntry> scope{{"orders", "orders"}, {"products", "products"}};
    ASSERT_EQ(resolver.ResolveColumns(scope),
              (std::vector<std::string_view>{"*", "id", "total", "*", "id", "price"}));
}

TEST_F(ScopeResolverTest, Views) {
    ScopeResolver resolver{catalog};
    std::vector<ScopeEntry> scope{{"active_orders", "active_orders"}};
    ASSERT_EQ(resolver.ResolveColumns(scope), (std::vector<std::string_view>{"*", "id"}));
}

TEST_F(ScopeResolverTest, AliasFallsBackToTable) {
    ScopeResolver resolver{catalog};
    std::vector<ScopeEntry> scope{{"orders", "o"}};
    ASSERT_EQ(resolver.ResolveColumns(scope), (std::vector<std::string_view>{"*", "id", "total"}));
}

TEST_F(ScopeResolverTest, ReferenceNameWins) {
    ScopeResolver resolver{catalog};
    std::vector<ScopeEntry> scope{{"orders", "products"}};
    ASSERT_EQ(resolver.ResolveColumns(scope), (std::vector<std::string_view>{"*", "id", "price"}));
}

TEST_F(ScopeResolverTest, TablesShadowViews) {
    std::vector<std::string> views{"orders"};
    catalog.ExtendRelations(views, proto::RelationKind::VIEW);
    std::vector<Catalog::ColumnRef> view_columns{{"orders", "v"}};
    ASSERT_EQ(catalog.ExtendColumns(view_columns, proto::RelationKind::VIEW), proto::StatusCode::OK);

    ScopeResolver resolver{catalog};
    std::vector<ScopeEntry> scope{{"orders", "orders"}};
    ASSERT_EQ(resolver.ResolveColumns(scope), (std::vector<std::string_view>{"*", "id", "total"}));
}

TEST_F(ScopeResolverTest, NamesAreEscaped) {
    ScopeResolver resolver{catalog};
    std::vector<ScopeEntry> scope{{"Users", "Users"}};
    ASSERT_EQ(resolver.ResolveColumns(scope), (std::vector<std::string_view>{"*", "name"}));
}

TEST_F(ScopeResolverTest, Misses) {
    ScopeResolver resolver{catalog};
    std::vector<ScopeEntry> scope{{"ghost", "g"}};
    ASSERT_TRUE(resolver.ResolveColumns(scope).empty());
    ASSERT_TRUE(resolver.ResolveColumns({}).empty());
    std::vector<ScopeEntry> mixed{{"ghost", "ghost"}, {"orders", "orders"}};
    ASSERT_EQ(resolver.ResolveColumns(mixed), (std::vector<std::string_view>{"*", "id", "total"}));
}

}  // namespace
