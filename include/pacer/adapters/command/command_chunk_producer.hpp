// File: include/pacer/adapters/command/command_chunk_producer.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <sys/types.h>

#include "pacer/core/io/chunk_producer.hpp"

namespace pacer {

struct CommandProducerConfig {
  std::string shell;  // passed to /bin/sh -c
};

// Runs an external segmenter per request. The document is written to the
// child's stdin, NDJSON is read from its stdout; both pipes are non-blocking so
// read() never stalls the event loop. stderr is inherited.
//
// POSIX only. SIGPIPE is ignored process-wide once a command starts, so a child
// that exits without draining stdin surfaces as a write error instead.
class CommandChunkProducer final : public IChunkProducer {
 public:
  explicit CommandChunkProducer(CommandProducerConfig cfg);
  ~CommandChunkProducer() override;

  CommandChunkProducer(const CommandChunkProducer&) = delete;
  CommandChunkProducer& operator=(const CommandChunkProducer&) = delete;

  Status start(const std::string& document) override;

  // eof once stdout is closed and the child exited 0; io_error on a non-zero
  // exit or signal.
  Status read(std::string* out) override;

  // Kills and reaps the child if it is still running.
  void cancel() override;

  std::string name() const override { return "command"; }

  [[nodiscard]] bool running() const noexcept { return pid_ > 0; }

 private:
  Status feed_stdin();
  Status drain_stdout(std::string* out);
  Status reap_if_exited();
  void close_fd(int& fd);

  CommandProducerConfig cfg_;

  pid_t pid_{-1};
  int in_fd_{-1};   // child's stdin (write end)
  int out_fd_{-1};  // child's stdout (read end)

  std::string input_;
  std::size_t input_pos_{0};
  bool stdout_eof_{false};

  // Set once the child was reaped; returned by every later read().
  std::optional<Status> final_;
};

}  // namespace pacer
