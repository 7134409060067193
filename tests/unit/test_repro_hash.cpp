// File: tests/unit/test_repro_hash.cpp
#include <gtest/gtest.h>

#include <string>

#include "pacer/core/util/repro_hash.hpp"

namespace pacer {
namespace {

TEST(ReproHash, ConfigHashIsStableAndSensitive) {
  Config a;
  Config b;
  EXPECT_EQ(compute_config_hash(a), compute_config_hash(b));
  EXPECT_EQ(compute_config_hash(a).size(), 16u);

  b.timing.base_wpm += 10;
  EXPECT_NE(compute_config_hash(a), compute_config_hash(b));

  Config c;
  c.producer.command.shell = "cat";
  EXPECT_NE(compute_config_hash(a), compute_config_hash(c));
}

TEST(ReproHash, DocumentHash) {
  EXPECT_EQ(compute_document_hash("some text"), compute_document_hash("some text"));
  EXPECT_NE(compute_document_hash("some text"), compute_document_hash("some text."));
  // FNV-1a over the length prefix and bytes; fixed for the empty document.
  EXPECT_EQ(compute_document_hash(""), compute_document_hash(std::string()));
}

}  // namespace
}  // namespace pacer
