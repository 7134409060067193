// File: tests/unit/test_line_framer.cpp
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "pacer/core/stream/line_framer.hpp"

namespace pacer {
namespace {

using Lines = std::vector<std::string>;

// Text of every framed line; a dropped line shows up as "<overlong>".
Lines texts(const std::vector<FramedLine>& framed) {
  Lines out;
  for (const auto& l : framed) out.push_back(l.overlong ? std::string("<overlong>") : l.text);
  return out;
}

TEST(LineFramer, ReassemblesRecordsSplitAcrossReads) {
  LineFramer f(1024);
  std::vector<FramedLine> out;
  f.push("{\"text\":\"he", &out);
  EXPECT_TRUE(out.empty());
  EXPECT_EQ(f.pending_bytes(), 10u);

  f.push("llo\"}\n{\"te", &out);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].text, "{\"text\":\"hello\"}");

  f.push("xt\"}\n", &out);
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1].text, "{\"text\"}");
  EXPECT_EQ(f.pending_bytes(), 0u);
}

TEST(LineFramer, SeveralLinesInOneRead) {
  LineFramer f(1024);
  std::vector<FramedLine> out;
  f.push("a\nb\n\nc", &out);
  EXPECT_EQ(texts(out), (Lines{"a", "b", ""}));
  auto tail = f.flush();
  ASSERT_TRUE(tail.has_value());
  EXPECT_EQ(*tail, "c");
  EXPECT_FALSE(f.flush().has_value());
}

TEST(LineFramer, StripsCarriageReturn) {
  LineFramer f(1024);
  std::vector<FramedLine> out;
  f.push("a\r\nb\r", &out);
  f.push("\n", &out);
  EXPECT_EQ(texts(out), (Lines{"a", "b"}));
}

TEST(LineFramer, DropsOverlongLinesWhole) {
  LineFramer f(4);
  std::vector<FramedLine> out;
  f.push("ok\n123", &out);
  f.push("456789", &out);  // exceeds 4 bytes without a newline
  f.push("0\nfine\n", &out);

  EXPECT_EQ(texts(out), (Lines{"ok", "<overlong>", "fine"}));
  EXPECT_EQ(f.dropped_overlong(), 1u);
}

TEST(LineFramer, ReportsADroppedLineInArrivalOrder) {
  LineFramer f(4);
  std::vector<FramedLine> out;
  f.push("a\nb\n1234567\nc\n", &out);
  EXPECT_EQ(texts(out), (Lines{"a", "b", "<overlong>", "c"}));
}

TEST(LineFramer, ClearForgetsPartialInput) {
  LineFramer f(1024);
  std::vector<FramedLine> out;
  f.push("partial", &out);
  f.clear();
  f.push("next\n", &out);
  EXPECT_EQ(texts(out), (Lines{"next"}));
}

}  // namespace
}  // namespace pacer
