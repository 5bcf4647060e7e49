#include <gtest/gtest.h>

#include "JsonCodec.hpp"

#include <chrono>

using namespace CapBridge;

TEST(JsonCodecTest, DecodesObjectsAndArrays) {
    DynamicValue v;
    std::string err;
    ASSERT_TRUE(JsonCodec::decode(R"({"a": [1, 2.5, "x"], "b": null, "c": true})", v, &err)) << err;
    ASSERT_TRUE(v.isTable());
    const DynamicValue* a = v.get("a");
    ASSERT_NE(a, nullptr);
    EXPECT_TRUE(a->isSequence());
    EXPECT_EQ(formatDebug(*a), "{1: 1, 2: 2.5, 3: \"x\"}");
    EXPECT_TRUE(v.get("b")->isNil());
    EXPECT_EQ(*v.get("c"), DynamicValue::boolean(true));
}

TEST(JsonCodecTest, MalformedInputFails) {
    DynamicValue v;
    std::string err;
    EXPECT_FALSE(JsonCodec::decode("{\"a\": ", v, &err));
    EXPECT_FALSE(err.empty());
}

TEST(JsonCodecTest, EmptyTableEncodesAsArray) {
    std::string out;
    ASSERT_TRUE(JsonCodec::encode(DynamicValue::table(), out, nullptr));
    EXPECT_EQ(out, "[]");
}

TEST(JsonCodecTest, EncodesIntegersWithoutFraction) {
    DynamicValue t = DynamicValue::table();
    t.set("n", DynamicValue::number(3));
    t.set("f", DynamicValue::number(0.25));
    std::string out;
    ASSERT_TRUE(JsonCodec::encode(t, out, nullptr));
    auto j = nlohmann::json::parse(out);
    EXPECT_TRUE(j["n"].is_number_integer());
    EXPECT_EQ(j["n"].get<int>(), 3);
    EXPECT_DOUBLE_EQ(j["f"].get<double>(), 0.25);
}

TEST(JsonCodecTest, MixedKeysFail) {
    DynamicValue t = DynamicValue::table();
    t.push(DynamicValue::text("first"));
    t.set("name", DynamicValue::text("x"));
    std::string out, err;
    EXPECT_FALSE(JsonCodec::encode(t, out, &err));
    EXPECT_NE(err.find("table keys"), std::string::npos);
}

TEST(JsonCodecTest, InvalidUtf8BytesFail) {
    std::string out, err;
    EXPECT_FALSE(JsonCodec::encode(DynamicValue::bytes(Bytes{0xff}), out, &err));
    EXPECT_TRUE(JsonCodec::encode(DynamicValue::bytes(Bytes{'o', 'k'}), out, &err));
    EXPECT_EQ(out, "\"ok\"");
}

TEST(JsonCodecTest, NonFiniteNumbersFail) {
    std::string out, err;
    EXPECT_FALSE(JsonCodec::encode(DynamicValue::number(1.0 / 0.0), out, &err));
}

TEST(JsonCodecTest, DecodeThenEncodeKeepsDocument) {
    const std::string doc = R"({"list":[1,2,3],"name":"n","nested":{"ok":false}})";
    DynamicValue v;
    ASSERT_TRUE(JsonCodec::decode(doc, v, nullptr));
    std::string out;
    ASSERT_TRUE(JsonCodec::encode(v, out, nullptr));
    EXPECT_EQ(nlohmann::json::parse(out), nlohmann::json::parse(doc));
}

TEST(JsonCodecTest, DeepNestingFails) {
    DynamicValue v;
    std::string err;
    EXPECT_FALSE(JsonCodec::decode(std::string(100000, '[') + std::string(100000, ']'), v, &err));
    EXPECT_EQ(err, "nesting exceeds 32 levels");

    err.clear();
    EXPECT_FALSE(JsonCodec::decode(std::string(kMaxTableDepth + 2, '[') + std::string(kMaxTableDepth + 2, ']'), v, &err));
    EXPECT_FALSE(err.empty());
}

TEST(JsonCodecTest, NestingUpToLimitDecodes) {
    std::string doc;
    for (int i = 0; i <= kMaxTableDepth; ++i) doc += "{\"a\":";
    doc += "1";
    doc += std::string(kMaxTableDepth + 1, '}');
    DynamicValue v;
    std::string err;
    ASSERT_TRUE(JsonCodec::decode(doc, v, &err)) << err;

    const DynamicValue* cur = &v;
    for (int i = 0; i <= kMaxTableDepth; ++i) {
        ASSERT_TRUE(cur->isTable());
        cur = cur->get("a");
        ASSERT_NE(cur, nullptr);
    }
    EXPECT_EQ(*cur, DynamicValue::number(1));
}

TEST(JsonCodecTest, DeepDocumentBuiltInMemoryFails) {
    nlohmann::json j = nlohmann::json::array();
    for (int i = 0; i < kMaxTableDepth + 3; ++i) j = nlohmann::json::array({j});
    DynamicValue v;
    std::string err;
    EXPECT_FALSE(JsonCodec::fromJson(j, v, &err));
    EXPECT_NE(err.find("nesting exceeds"), std::string::npos);
}

TEST(JsonCodecTest, LargeArrayDecodesInLinearTime) {
    const int n = 200000;
    std::string doc = "[";
    for (int i = 0; i < n; ++i) {
        if (i) doc += ",";
        doc += std::to_string(i);
    }
    doc += "]";

    auto start = std::chrono::steady_clock::now();
    DynamicValue v;
    ASSERT_TRUE(JsonCodec::decode(doc, v, nullptr));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(v.asTable().size(), static_cast<size_t>(n));
    EXPECT_EQ(v.asTable().back().first, DynamicValue::number(n));
    EXPECT_EQ(v.asTable().back().second, DynamicValue::number(n - 1));
    EXPECT_TRUE(v.isSequence());
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 3000);
}
