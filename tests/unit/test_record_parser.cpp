// File: tests/unit/test_record_parser.cpp
#include <gtest/gtest.h>

#include "pacer/core/stream/record_parser.hpp"

namespace pacer {
namespace {

TEST(RecordParser, ParsesAWellFormedRecord) {
  auto r = parse_chunk_record(R"({"text":"Hello, world.","complexity":0.25})");
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->text, "Hello, world.");
  EXPECT_DOUBLE_EQ(r->complexity, 0.25);
}

TEST(RecordParser, DecodesJsonEscapes) {
  auto r = parse_chunk_record(R"({"text":"say \"hi\"é","complexity":0})");
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->text, "say \"hi\"\xC3\xA9");
}

TEST(RecordParser, DecodesSurrogatePairEscapes) {
  // U+1F600 as escaped by an ASCII-only JSON encoder.
  auto r = parse_chunk_record(R"({"text":"smile \ud83d\ude00","complexity":0.5})");
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->text, "smile \xF0\x9F\x98\x80");
  EXPECT_DOUBLE_EQ(r->complexity, 0.5);
}

TEST(RecordParser, IgnoresExtraKeysAndKeyOrder) {
  auto r = parse_chunk_record(R"({"complexity":1,"id":7,"text":"x"})");
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(r->text, "x");
  EXPECT_DOUBLE_EQ(r->complexity, 1.0);
}

TEST(RecordParser, ClampsComplexity) {
  auto hi = parse_chunk_record(R"({"text":"a","complexity":3.5})");
  auto lo = parse_chunk_record(R"({"text":"a","complexity":-1})");
  ASSERT_TRUE(hi.ok());
  ASSERT_TRUE(lo.ok());
  EXPECT_DOUBLE_EQ(hi->complexity, 1.0);
  EXPECT_DOUBLE_EQ(lo->complexity, 0.0);
}

TEST(RecordParser, RejectsMalformedInput) {
  EXPECT_FALSE(parse_chunk_record("not json at all").ok());
  EXPECT_FALSE(parse_chunk_record(R"({"text":"a","complexity":0.5)").ok());
  EXPECT_FALSE(parse_chunk_record("text: a\ncomplexity: 0.5").ok());
  EXPECT_FALSE(parse_chunk_record(R"(["a", 0.5])").ok());
  EXPECT_FALSE(parse_chunk_record("").ok());
}

TEST(RecordParser, RejectsSyntaxThatIsNotJson) {
  EXPECT_EQ(parse_chunk_record(R"({"text":"x","complexity":.5})").status().code(),
            Status::Code::kParseError);
  EXPECT_EQ(parse_chunk_record(R"({"text":"x","complexity":0.5,})").status().code(),
            Status::Code::kParseError);
  EXPECT_EQ(parse_chunk_record(R"({'text':'x','complexity':0.5})").status().code(),
            Status::Code::kParseError);
  EXPECT_EQ(parse_chunk_record(R"({text: "x", complexity: 0.5})").status().code(),
            Status::Code::kParseError);
  EXPECT_EQ(parse_chunk_record(R"({"text":"lone \ud83d","complexity":0.5})").status().code(),
            Status::Code::kParseError);
}

TEST(RecordParser, RejectsMissingOrMistypedFields) {
  EXPECT_FALSE(parse_chunk_record(R"({"complexity":0.5})").ok());
  EXPECT_FALSE(parse_chunk_record(R"({"text":"a"})").ok());
  EXPECT_FALSE(parse_chunk_record(R"({"text":"","complexity":0.5})").ok());
  EXPECT_FALSE(parse_chunk_record(R"({"text":12,"complexity":0.5})").ok());
  EXPECT_FALSE(parse_chunk_record(R"({"text":"a","complexity":"0.5"})").ok());
  EXPECT_FALSE(parse_chunk_record(R"({"text":"a","complexity":null})").ok());
  EXPECT_FALSE(parse_chunk_record(R"({"text":"a","complexity":true})").ok());
  EXPECT_FALSE(parse_chunk_record(R"({"text":["a"],"complexity":0.5})").ok());
}

TEST(RecordParser, FormatsRecordsItCanReadBack) {
  const Chunk c{"a \"quoted\" line\\", 0.5};
  auto r = parse_chunk_record(format_chunk_record(c));
  ASSERT_TRUE(r.ok()) << r.status().message();
  EXPECT_EQ(*r, c);
}

}  // namespace
}  // namespace pacer
