#include <gtest/gtest.h>

#include "core/json_lite.hpp"

using namespace termpanel::json;

TEST(JsonLite, ParsesScalars)
{
    EXPECT_TRUE(parse("null")->is_null());
    EXPECT_TRUE(parse("true")->as_bool());
    EXPECT_FALSE(parse("false")->as_bool());
    EXPECT_DOUBLE_EQ(parse("-12.5e1")->as_number(), -125.0);
    EXPECT_EQ(parse("\"hi\"")->as_string(), "hi");
}

TEST(JsonLite, ParsesNestedDocument)
{
    auto doc = parse(R"({
        "socket_path": "/run/tp.sock",
        "display": { "panel_count": 2, "enabled": true },
        "list": [1, "two", [3]]
    })");
    ASSERT_TRUE(doc.has_value());
    ASSERT_TRUE(doc->is_object());
    EXPECT_EQ(doc->get_string("socket_path"), "/run/tp.sock");

    const Value* display = doc->find("display");
    ASSERT_NE(display, nullptr);
    EXPECT_EQ(display->get_int("panel_count"), 2);
    EXPECT_EQ(display->get_bool("enabled"), true);

    const Value* list = doc->find("list");
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->as_array().size(), 3u);
    EXPECT_EQ(list->as_array()[1].as_string(), "two");
    EXPECT_TRUE(list->as_array()[2].is_array());
}

TEST(JsonLite, TypedGettersRejectWrongTypes)
{
    auto doc = parse(R"({"n": "5", "s": 5, "b": 1})");
    ASSERT_TRUE(doc.has_value());
    EXPECT_FALSE(doc->get_int("n").has_value());
    EXPECT_FALSE(doc->get_string("s").has_value());
    EXPECT_FALSE(doc->get_bool("b").has_value());
    EXPECT_FALSE(doc->get_int("missing").has_value());
    EXPECT_EQ(parse("[1]")->find("x"), nullptr);
}

TEST(JsonLite, StringEscapes)
{
    auto v = parse(R"("a\"b\\c\ndé😀")");
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(v->as_string(), "a\"b\\c\nd\xC3\xA9\xF0\x9F\x98\x80");
}

TEST(JsonLite, RejectsMalformedInput)
{
    size_t where = 0;
    EXPECT_FALSE(parse("{\"a\": }", &where).has_value());
    EXPECT_GT(where, 0u);
    EXPECT_FALSE(parse("[1, 2").has_value());
    EXPECT_FALSE(parse("{} trailing").has_value());
    EXPECT_FALSE(parse("").has_value());
    EXPECT_FALSE(parse("'single'").has_value());
}

TEST(JsonLite, EscapeControlCharacters)
{
    EXPECT_EQ(escape("q\"b\\n\n\t"), "q\\\"b\\\\n\\n\\t");
    EXPECT_EQ(escape(std::string("\x01", 1)), "\\u0001");
}

TEST(JsonLite, SerializeThenParsePreservesContent)
{
    Value::Object entry;
    entry["label"]   = "build";
    entry["command"] = "make -j8 && echo \"done\"";
    Value::Object root;
    root["term-main"] = Value(Value::Array{Value(entry)});
    root["empty"]     = Value(Value::Array{});
    root["flag"]      = true;

    std::string text = serialize(Value(root));
    EXPECT_NE(text.find("\n  \""), std::string::npos);

    auto back = parse(text);
    ASSERT_TRUE(back.has_value());
    const Value* list = back->find("term-main");
    ASSERT_NE(list, nullptr);
    ASSERT_EQ(list->as_array().size(), 1u);
    EXPECT_EQ(list->as_array()[0].get_string("command"), "make -j8 && echo \"done\"");
    EXPECT_TRUE(back->find("empty")->as_array().empty());
    EXPECT_EQ(back->get_bool("flag"), true);
}
