#include <gtest/gtest.h>
#include "typetag/codec.hpp"
#include "typetag/error.hpp"

using namespace typetag;

// ---- Parse tests ----

TEST(JsonCodecParse, Object) {
    auto p = JsonCodec::parse(R"({"b":1,"a":[true,null,"x"],"c":{"d":2.5}})");
    ASSERT_TRUE(p.is_object());
    EXPECT_EQ(p.at("b"), 1);
    EXPECT_EQ(p.at("a"), Primitive::array({true, nullptr, "x"}));
    EXPECT_DOUBLE_EQ(p.at("c").at("d").get<double>(), 2.5);
}

TEST(JsonCodecParse, KeepsKeyOrder) {
    auto p = JsonCodec::parse(R"({"zeta":1,"alpha":2,"mid":3})");
    EXPECT_EQ(p.dump(), R"({"zeta":1,"alpha":2,"mid":3})");
}

TEST(JsonCodecParse, ScalarDocuments) {
    EXPECT_EQ(JsonCodec::parse(R"("$uuid:abc")"), Primitive("$uuid:abc"));
    EXPECT_EQ(JsonCodec::parse("42"), Primitive(42));
    EXPECT_EQ(JsonCodec::parse("-7"), Primitive(-7));
    EXPECT_DOUBLE_EQ(JsonCodec::parse("3.25").get<double>(), 3.25);
    EXPECT_EQ(JsonCodec::parse("true"), Primitive(true));
    EXPECT_TRUE(JsonCodec::parse("null").is_null());
}

TEST(JsonCodecParse, NumberKinds) {
    auto p = JsonCodec::parse("[1, -1, 18446744073709551615, 1.5]");
    EXPECT_TRUE(p[0].is_number_integer());
    EXPECT_TRUE(p[1].is_number_integer());
    EXPECT_TRUE(p[2].is_number_unsigned());
    EXPECT_TRUE(p[3].is_number_float());
}

TEST(JsonCodecParse, EscapedStrings) {
    auto p = JsonCodec::parse(R"({"k\"ey":"line\nbreak é"})");
    EXPECT_EQ(p.at("k\"ey"), "line\nbreak \xc3\xa9");
}

TEST(JsonCodecParse, EmptyInput) {
    EXPECT_THROW((void)JsonCodec::parse(""), ParseError);
}

TEST(JsonCodecParse, InvalidJson) {
    EXPECT_THROW((void)JsonCodec::parse("{invalid json"), ParseError);
    EXPECT_THROW((void)JsonCodec::parse(R"({"a":})"), ParseError);
}

TEST(JsonCodecParse, TrailingContent) {
    EXPECT_THROW((void)JsonCodec::parse(R"({"a":1} {"b":2})"), ParseError);
}

// ---- Serialize tests ----

TEST(JsonCodecSerialize, Compact) {
    Primitive p = {{"$t", "mytype"}, {"v", Primitive::array({"hello", 3.14, Primitive::array({"world"})})}};
    EXPECT_EQ(JsonCodec::serialize(p), R"({"$t":"mytype","v":["hello",3.14,["world"]]})");
}

TEST(JsonCodecSerialize, Indented) {
    Primitive p = {{"a", 1}};
    EXPECT_EQ(JsonCodec::serialize(p, 2), "{\n  \"a\": 1\n}");
}

TEST(JsonCodecSerialize, InvalidUtf8) {
    Primitive p = std::string("\xff\xfe");
    EXPECT_THROW((void)JsonCodec::serialize(p), EncodeError);
}

TEST(JsonCodecSerialize, RoundTrip) {
    const std::string original = R"({"x":[1,2,{"y":"/$z"}],"w":null})";
    EXPECT_EQ(JsonCodec::serialize(JsonCodec::parse(original)), original);
}

TEST(JsonCodec, FunctionAdapters) {
    TextEncoder enc = JsonCodec::encoder();
    TextDecoder dec = JsonCodec::decoder();
    EXPECT_EQ(enc(dec(R"(["a",1])")), R"(["a",1])");
}
