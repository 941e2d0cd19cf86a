#include "sqlcomplete/text/name_codec.h"

#include "gtest/gtest.h"

using namespace sqlcomplete;

namespace {

TEST(NameCodecTest, PlainNames) {
    for (std::string_view name : {"users", "_tmp", "a", "order_items2", "price$"}) {
        ASSERT_TRUE(NameCodec::IsPlainName(name)) << name;
        ASSERT_EQ(NameCodec::Escape(name), name);
        ASSERT_EQ(NameCodec::Unescape(NameCodec::Escape(name)), name);
    }
}

TEST(NameCodecTest, QuotedNames) {
    ASSERT_EQ(NameCodec::Escape("Users"), "\"Users\"");
    ASSERT_EQ(NameCodec::Escape("1st"), "\"1st\"");
    ASSERT_EQ(NameCodec::Escape("order items"), "\"order items\"");
    ASSERT_EQ(NameCodec::Escape("$price"), "\"$price\"");
    ASSERT_EQ(NameCodec::Escape("schema.table"), "\"schema.table\"");
    ASSERT_EQ(NameCodec::Escape(""), "\"\"");
}

TEST(NameCodecTest, EmbeddedQuotesAreKept) {
    ASSERT_EQ(NameCodec::Escape("a\"b"), "\"a\"b\"");
    ASSERT_EQ(NameCodec::Unescape("\"a\"b\""), "a\"b");
}

TEST(NameCodecTest, Unescape) {
    ASSERT_EQ(NameCodec::Unescape("\"Users\""), "Users");
    ASSERT_EQ(NameCodec::Unescape("users"), "users");
    ASSERT_EQ(NameCodec::Unescape("\"\""), "");
    ASSERT_EQ(NameCodec::Unescape("\""), "");
    ASSERT_EQ(NameCodec::Unescape("\"open"), "\"open");
    ASSERT_EQ(NameCodec::Unescape(""), "");
}

TEST(NameCodecTest, EscapeAll) {
    std::vector<std::string> names{"id", "Name", "e mail"};
    auto escaped = NameCodec::EscapeAll(names);
    ASSERT_EQ(escaped, (std::vector<std::string>{"id", "\"Name\"", "\"e mail\""}));
}

}  // namespace
