// File: tests/unit/test_producers.cpp
#include <gtest/gtest.h>

#include <chrono>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "pacer/adapters/command/command_chunk_producer.hpp"
#include "pacer/adapters/ndjson_file/ndjson_file_producer.hpp"
#include "pacer/adapters/synth/synth_chunk_producer.hpp"
#include "pacer/core/stream/record_parser.hpp"

namespace pacer {
namespace {

std::string data_path(const std::string& rel) {
  return std::string(PACER_TEST_DATA_DIR) + "/" + rel;
}

// Reads until the producer reports anything but OK (or the deadline passes).
Status drain(IChunkProducer& p, std::string* out, std::vector<std::size_t>* sizes = nullptr,
             std::chrono::milliseconds deadline = std::chrono::seconds(10)) {
  const auto until = std::chrono::steady_clock::now() + deadline;
  while (std::chrono::steady_clock::now() < until) {
    std::string piece;
    const Status st = p.read(&piece);
    if (sizes && !piece.empty()) sizes->push_back(piece.size());
    out->append(piece);
    if (!st.ok()) return st;
    if (piece.empty()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return Status::internal("drain timed out");
}

std::vector<Chunk> parse_lines(const std::string& ndjson) {
  std::vector<Chunk> out;
  std::istringstream ss(ndjson);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.empty()) continue;
    auto r = parse_chunk_record(line);
    if (r.ok()) out.push_back(r.take_value());
  }
  return out;
}

// -----------------------------
// Synth
// -----------------------------

TEST(SynthChunkProducer, SegmentsAtPhraseLengthAndPunctuation) {
  SynthProducerConfig cfg;
  cfg.min_words = 3;
  cfg.max_words = 3;
  const auto chunks =
      SynthChunkProducer::segment("The quick brown fox, jumps over the lazy dog. End", cfg);

  std::vector<std::string> texts;
  for (const auto& c : chunks) texts.push_back(c.text);
  EXPECT_EQ(texts, (std::vector<std::string>{"The quick brown", "fox,", "jumps over the",
                                             "lazy dog.", "End"}));
  for (const auto& c : chunks) {
    EXPECT_GE(c.complexity, 0.0);
    EXPECT_LE(c.complexity, 1.0);
  }
}

TEST(SynthChunkProducer, LongWordsScoreHigher) {
  const std::vector<std::string_view> easy = {"a", "cat", "sat"};
  const std::vector<std::string_view> hard = {"incomprehensibility", "notwithstanding"};
  EXPECT_LT(SynthChunkProducer::score_complexity(easy), SynthChunkProducer::score_complexity(hard));
  EXPECT_DOUBLE_EQ(SynthChunkProducer::score_complexity({}), 0.0);
}

TEST(SynthChunkProducer, IsDeterministicForASeed) {
  SynthProducerConfig cfg;
  cfg.seed = 42;
  cfg.min_words = 1;
  cfg.max_words = 6;
  const std::string doc = "one two three four five six seven eight nine ten eleven twelve";
  EXPECT_EQ(SynthChunkProducer::segment(doc, cfg), SynthChunkProducer::segment(doc, cfg));
}

TEST(SynthChunkProducer, ServesItsSegmentsAsNdjsonInSmallReads) {
  SynthProducerConfig cfg;
  cfg.bytes_per_read = 7;
  SynthChunkProducer p(cfg);
  const std::string doc = "Reading fast is a skill; practice helps. Really!";

  ASSERT_TRUE(p.start(doc).ok());
  std::string all;
  std::vector<std::size_t> sizes;
  const Status st = drain(p, &all, &sizes);

  EXPECT_TRUE(st.is_eof()) << st.message();
  for (std::size_t n : sizes) EXPECT_LE(n, 7u);
  EXPECT_EQ(parse_lines(all), SynthChunkProducer::segment(doc, cfg));
}

TEST(SynthChunkProducer, CancelStopsTheResponse) {
  SynthChunkProducer p(SynthProducerConfig{});
  ASSERT_TRUE(p.start("some words here").ok());
  p.cancel();
  p.cancel();
  std::string out;
  EXPECT_EQ(p.read(&out).code(), Status::Code::kCancelled);
  EXPECT_TRUE(out.empty());
}

// -----------------------------
// NDJSON file
// -----------------------------

TEST(NdjsonFileProducer, ReplaysTheFileInBoundedReads) {
  NdjsonFileProducerConfig cfg;
  cfg.path = data_path("sample.ndjson");
  cfg.bytes_per_read = 16;
  NdjsonFileProducer p(cfg);

  ASSERT_TRUE(p.start("ignored").ok());
  std::string all;
  std::vector<std::size_t> sizes;
  EXPECT_TRUE(drain(p, &all, &sizes).is_eof());
  for (std::size_t n : sizes) EXPECT_LE(n, 16u);

  const auto chunks = parse_lines(all);
  ASSERT_EQ(chunks.size(), 4u);
  EXPECT_EQ(chunks.front().text, "The quick brown fox,");
  EXPECT_EQ(chunks.back().text, "Finally: the end!");
}

TEST(NdjsonFileProducer, MissingFileFailsToStart) {
  NdjsonFileProducerConfig cfg;
  cfg.path = data_path("nope.ndjson");
  NdjsonFileProducer p(cfg);
  EXPECT_EQ(p.start("doc").code(), Status::Code::kNotFound);
}

// -----------------------------
// Command
// -----------------------------

TEST(CommandChunkProducer, PipesTheDocumentThroughTheCommand) {
  CommandChunkProducer p(CommandProducerConfig{"cat"});
  const std::string doc = "{\"text\":\"echoed\",\"complexity\":0.5}\n";

  ASSERT_TRUE(p.start(doc).ok());
  std::string out;
  const Status st = drain(p, &out);
  EXPECT_TRUE(st.is_eof()) << st.message();
  EXPECT_EQ(out, doc);
  EXPECT_FALSE(p.running());
}

TEST(CommandChunkProducer, LargeDocumentsDoNotDeadlock) {
  CommandChunkProducer p(CommandProducerConfig{"cat"});
  const std::string doc(512 * 1024, 'x');

  ASSERT_TRUE(p.start(doc).ok());
  std::string out;
  EXPECT_TRUE(drain(p, &out).is_eof());
  EXPECT_EQ(out.size(), doc.size());
}

TEST(CommandChunkProducer, NonZeroExitIsAnIoError) {
  CommandChunkProducer p(CommandProducerConfig{"echo partial; exit 3"});
  ASSERT_TRUE(p.start("").ok());
  std::string out;
  const Status st = drain(p, &out);
  EXPECT_EQ(st.code(), Status::Code::kIoError);
  EXPECT_NE(st.message().find("3"), std::string::npos);
  EXPECT_EQ(out, "partial\n");
}

TEST(CommandChunkProducer, CancelKillsARunningCommand) {
  CommandChunkProducer p(CommandProducerConfig{"sleep 30"});
  ASSERT_TRUE(p.start("").ok());
  EXPECT_TRUE(p.running());

  const auto t0 = std::chrono::steady_clock::now();
  p.cancel();
  EXPECT_FALSE(p.running());
  EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(5));

  std::string out;
  EXPECT_EQ(p.read(&out).code(), Status::Code::kCancelled);
  p.cancel();
}

TEST(CommandChunkProducer, CommandRunsWithDefaultSigpipe) {
  // The inner shell signals itself; with SIGPIPE ignored it would exit 0.
  CommandChunkProducer p(CommandProducerConfig{"sh -c 'kill -PIPE $$; exit 0'; echo $?"});
  ASSERT_TRUE(p.start("").ok());
  std::string out;
  EXPECT_TRUE(drain(p, &out).is_eof());
  EXPECT_EQ(out, "141\n");
}

TEST(CommandChunkProducer, EmptyShellIsRejected) {
  CommandChunkProducer p(CommandProducerConfig{});
  EXPECT_EQ(p.start("doc").code(), Status::Code::kInvalidArgument);
}

}  // namespace
}  // namespace pacer
