// File: src/adapters/command/command_chunk_producer.cpp
#include "pacer/adapters/command/command_chunk_producer.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace pacer {
namespace {

constexpr std::size_t kReadChunk = 4096;

std::string errno_text(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

Status set_nonblocking(int fd) {
  const int flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    return Status::io_error(errno_text("CommandChunkProducer: fcntl"));
  }
  return Status::ok_status();
}

}  // namespace

CommandChunkProducer::CommandChunkProducer(CommandProducerConfig cfg) : cfg_(std::move(cfg)) {}

CommandChunkProducer::~CommandChunkProducer() { cancel(); }

void CommandChunkProducer::close_fd(int& fd) {
  if (fd >= 0) ::close(fd);
  fd = -1;
}

Status CommandChunkProducer::start(const std::string& document) {
  cancel();
  if (cfg_.shell.empty()) return Status::invalid_argument("CommandChunkProducer: shell is empty");

  std::signal(SIGPIPE, SIG_IGN);

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
    return Status::io_error(errno_text("CommandChunkProducer: pipe"));
  }
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    const Status st = Status::io_error(errno_text("CommandChunkProducer: pipe"));
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    return st;
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    const Status st = Status::io_error(errno_text("CommandChunkProducer: fork"));
    for (int fd : {in_pipe[0], in_pipe[1], out_pipe[0], out_pipe[1]}) ::close(fd);
    return st;
  }

  if (pid == 0) {
    // Child: dup2 clears O_CLOEXEC on the targets; everything else closes on exec.
    if (::dup2(in_pipe[0], STDIN_FILENO) < 0 || ::dup2(out_pipe[1], STDOUT_FILENO) < 0) {
      ::_exit(127);
    }
    // SIG_IGN would survive exec; the command gets the default.
    std::signal(SIGPIPE, SIG_DFL);
    ::execl("/bin/sh", "sh", "-c", cfg_.shell.c_str(), static_cast<char*>(nullptr));
    ::_exit(127);
  }

  ::close(in_pipe[0]);
  ::close(out_pipe[1]);
  pid_ = pid;
  in_fd_ = in_pipe[1];
  out_fd_ = out_pipe[0];

  input_ = document;
  input_pos_ = 0;
  stdout_eof_ = false;
  final_.reset();

  Status st = set_nonblocking(in_fd_);
  if (st.ok()) st = set_nonblocking(out_fd_);
  if (!st.ok()) {
    cancel();
    return st;
  }
  return Status::ok_status();
}

Status CommandChunkProducer::feed_stdin() {
  while (in_fd_ >= 0 && input_pos_ < input_.size()) {
    const ssize_t n = ::write(in_fd_, input_.data() + input_pos_, input_.size() - input_pos_);
    if (n > 0) {
      input_pos_ += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return Status::ok_status();
    if (n < 0 && errno == EPIPE) {
      // The child stopped reading; its exit status decides the outcome.
      close_fd(in_fd_);
      return Status::ok_status();
    }
    return Status::io_error(errno_text("CommandChunkProducer: write to child"));
  }
  // All input delivered: close so the child sees end of input.
  close_fd(in_fd_);
  return Status::ok_status();
}

Status CommandChunkProducer::drain_stdout(std::string* out) {
  char buf[kReadChunk];
  while (out_fd_ >= 0) {
    const ssize_t n = ::read(out_fd_, buf, sizeof(buf));
    if (n > 0) {
      out->append(buf, static_cast<std::size_t>(n));
      continue;
    }
    if (n == 0) {
      close_fd(out_fd_);
      stdout_eof_ = true;
      break;
    }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) break;
    return Status::io_error(errno_text("CommandChunkProducer: read from child"));
  }
  return Status::ok_status();
}

Status CommandChunkProducer::reap_if_exited() {
  int wstatus = 0;
  const pid_t r = ::waitpid(pid_, &wstatus, WNOHANG);
  if (r == 0) return Status::ok_status();  // still running
  if (r < 0) {
    final_ = Status::io_error(errno_text("CommandChunkProducer: waitpid"));
  } else if (WIFEXITED(wstatus) && WEXITSTATUS(wstatus) == 0) {
    final_ = Status::out_of_range("eof");
  } else if (WIFEXITED(wstatus)) {
    final_ = Status::io_error("CommandChunkProducer: command exited with status " +
                              std::to_string(WEXITSTATUS(wstatus)));
  } else if (WIFSIGNALED(wstatus)) {
    final_ = Status::io_error("CommandChunkProducer: command killed by signal " +
                              std::to_string(WTERMSIG(wstatus)));
  } else {
    final_ = Status::io_error("CommandChunkProducer: command ended abnormally");
  }
  pid_ = -1;
  close_fd(in_fd_);
  return *final_;
}

Status CommandChunkProducer::read(std::string* out) {
  if (!out) return Status::invalid_argument("CommandChunkProducer::read: out is null");
  if (final_) return *final_;
  if (pid_ <= 0) return Status::cancelled("CommandChunkProducer::read: no active request");

  PACER_RETURN_IF_ERROR(feed_stdin());
  PACER_RETURN_IF_ERROR(drain_stdout(out));

  // Output is complete only when stdout closed; then wait for the exit status.
  // Bytes appended this call are still delivered along with eof.
  if (stdout_eof_) return reap_if_exited();
  return Status::ok_status();
}

void CommandChunkProducer::cancel() {
  close_fd(in_fd_);
  close_fd(out_fd_);
  if (pid_ > 0) {
    ::kill(pid_, SIGKILL);
    int wstatus = 0;
    while (::waitpid(pid_, &wstatus, 0) < 0 && errno == EINTR) {
    }
    pid_ = -1;
  }
  input_.clear();
  input_pos_ = 0;
  stdout_eof_ = false;
  final_.reset();
}

}  // namespace pacer
