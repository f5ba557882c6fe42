#include <gtest/gtest.h>
#include <map>
#include <stdexcept>
#include <string>

#include "util/json_map.hpp"

namespace {

using chunkworker::util::json::decodeStringMap;
using chunkworker::util::json::encodeStringMap;
using chunkworker::util::json::escapeString;

TEST(JsonMapTest, EncodesInKeyOrder) {
    std::map<std::string, std::string> files{{"logs.parquet", "https://x/l"},
                                             {"blocks.parquet", "https://x/b"}};
    EXPECT_EQ(encodeStringMap(files),
              R"({"blocks.parquet":"https://x/b","logs.parquet":"https://x/l"})");
    EXPECT_EQ(encodeStringMap({}), "{}");
}

TEST(JsonMapTest, EscapesControlAndQuoteCharacters) {
    EXPECT_EQ(escapeString("a\"b\\c\n\t"), "a\\\"b\\\\c\\n\\t");
    EXPECT_EQ(escapeString(std::string(1, '\x01')), "\\u0001");
}

TEST(JsonMapTest, DecodesWhitespaceAndEscapes) {
    auto files = decodeStringMap(" { \"a\" : \"x\\\"y\" ,\n \"b\":\"\\u00e9\\n\" } ");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files["a"], "x\"y");
    EXPECT_EQ(files["b"], "\xc3\xa9\n");
}

TEST(JsonMapTest, DecodesSurrogatePairs) {
    auto files = decodeStringMap(R"({"k":"\ud83d\ude00"})");
    EXPECT_THROW(decodeStringMap(R"({"k":"\ud83d"})"), std::runtime_error);
    EXPECT_EQ(files["k"], "\xf0\x9f\x98\x80");
}

TEST(JsonMapTest, EncodedTextDecodesToSameMap) {
    std::map<std::string, std::string> files{{"we\"ird\\name", "line1\nline2"}, {"plain", ""}};
    EXPECT_EQ(decodeStringMap(encodeStringMap(files)), files);
}

TEST(JsonMapTest, RejectsMalformedInput) {
    EXPECT_THROW(decodeStringMap(""), std::runtime_error);
    EXPECT_THROW(decodeStringMap("{"), std::runtime_error);
    EXPECT_THROW(decodeStringMap(R"({"a":1})"), std::runtime_error);
    EXPECT_THROW(decodeStringMap(R"({"a":"x",})"), std::runtime_error);
    EXPECT_THROW(decodeStringMap(R"({"a":"x","a":"y"})"), std::runtime_error);
    EXPECT_THROW(decodeStringMap(R"({"a":"x"} trailing)"), std::runtime_error);
    EXPECT_THROW(decodeStringMap(R"(["a"])"), std::runtime_error);
}

} // namespace
