// File: src/apps/pacer_cli/main.cpp
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <utility>

#include "pacer/adapters/command/command_chunk_producer.hpp"
#include "pacer/adapters/ndjson_file/ndjson_file_producer.hpp"
#include "pacer/adapters/synth/synth_chunk_producer.hpp"
#include "pacer/core/events/jsonl_event_sink.hpp"
#include "pacer/core/events/session_recorder.hpp"
#include "pacer/core/io/chunk_producer.hpp"
#include "pacer/core/sched/event_loop.hpp"
#include "pacer/core/session/reader_session.hpp"
#include "pacer/core/util/config_loader.hpp"

namespace {

pacer::SteadyEventLoop* g_loop = nullptr;

extern "C" void on_signal(int /*sig*/) {
  if (g_loop) g_loop->stop();
}

struct Args {
  std::string config_path;
  std::string input_path{"-"};
  int wpm{0};  // 0 = keep config
  bool no_events{false};
  bool quiet{false};
  bool help{false};
  bool bad{false};
};

Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string s = argv[i];
    if (s == "--help" || s == "-h") {
      a.help = true;
      return a;
    }
    if (s == "--config" && i + 1 < argc) {
      a.config_path = argv[++i];
      continue;
    }
    if (s == "--input" && i + 1 < argc) {
      a.input_path = argv[++i];
      continue;
    }
    if (s == "--wpm" && i + 1 < argc) {
      const std::string v = argv[++i];
      std::istringstream ss(v);
      if (!(ss >> a.wpm) || !ss.eof()) {
        a.bad = true;
        return a;
      }
      continue;
    }
    if (s == "--no-events") {
      a.no_events = true;
      continue;
    }
    if (s == "--quiet") {
      a.quiet = true;
      continue;
    }
    a.bad = true;
    return a;
  }
  return a;
}

void print_usage() {
  std::cout << "pacer\n"
            << "  --config <path>\n"
            << "  [--input <file>|-]   document text (default: stdin)\n"
            << "  [--wpm N]            override timing.base_wpm\n"
            << "  [--no-events]        do not write the JSONL event log\n"
            << "  [--quiet]            do not print chunks\n";
}

pacer::Result<std::string> read_document(const std::string& path) {
  if (path == "-") {
    std::string s{std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
    return pacer::Result<std::string>::ok(std::move(s));
  }
  std::ifstream f(path, std::ios::binary);
  if (!f.is_open()) {
    return pacer::Result<std::string>::err(pacer::Status::not_found("cannot open input: " + path));
  }
  std::string s{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
  if (f.bad()) {
    return pacer::Result<std::string>::err(pacer::Status::io_error("failed reading input: " + path));
  }
  return pacer::Result<std::string>::ok(std::move(s));
}

std::unique_ptr<pacer::IChunkProducer> make_producer_from_config(const pacer::Config& cfg) {
  if (cfg.producer.type == "synth") {
    pacer::SynthProducerConfig sc;
    sc.seed = cfg.producer.synth.seed;
    sc.min_words = cfg.producer.synth.min_words;
    sc.max_words = cfg.producer.synth.max_words;
    sc.bytes_per_read = cfg.producer.synth.bytes_per_read;
    return std::make_unique<pacer::SynthChunkProducer>(sc);
  }

  if (cfg.producer.type == "ndjson_file") {
    pacer::NdjsonFileProducerConfig fc;
    fc.path = cfg.producer.ndjson_file.path;
    fc.bytes_per_read = cfg.producer.ndjson_file.bytes_per_read;
    return std::make_unique<pacer::NdjsonFileProducer>(fc);
  }

  if (cfg.producer.type == "command") {
    pacer::CommandProducerConfig cc;
    cc.shell = cfg.producer.command.shell;
    return std::make_unique<pacer::CommandChunkProducer>(cc);
  }

  return nullptr;
}

// Prints each chunk as it is shown.
class ConsolePrinter final : public pacer::PlaybackObserver {
 public:
  explicit ConsolePrinter(const pacer::ReaderSession& session) : session_(session) {}

  void on_display(const pacer::DisplayFrame& frame) override {
    if (!frame.chunk) return;
    std::cout << "[" << frame.index + 1 << "/" << session_.total_chunks() << "] "
              << frame.chunk->text << "  (inst " << frame.inst_wpm << " wpm, avg "
              << session_.dynamic_wpm() << " wpm)\n"
              << std::flush;
  }

 private:
  const pacer::ReaderSession& session_;
};

}  // namespace

int main(int argc, char** argv) {
  const Args args = parse_args(argc, argv);
  if (args.help || args.bad || args.config_path.empty()) {
    print_usage();
    return args.help ? 0 : 2;
  }

  auto cfg_r = pacer::load_config(args.config_path);
  if (!cfg_r.ok()) {
    std::cerr << cfg_r.status().message() << "\n";
    return 1;
  }
  pacer::Config cfg = cfg_r.take_value();

  if (args.wpm != 0) {
    cfg.timing.base_wpm = args.wpm;
    const pacer::Status st = pacer::validate_timing_config(cfg.timing);
    if (!st.ok()) {
      std::cerr << "--wpm: " << st.message() << "\n";
      return 2;
    }
  }
  const bool record = cfg.output.record_events && !args.no_events;

  auto doc_r = read_document(args.input_path);
  if (!doc_r.ok()) {
    std::cerr << doc_r.status().message() << "\n";
    return 2;
  }
  const std::string document = doc_r.take_value();

  std::unique_ptr<pacer::IChunkProducer> producer = make_producer_from_config(cfg);
  if (!producer) {
    std::cerr << "Unknown producer.type: " << cfg.producer.type << "\n";
    return 1;
  }
  const std::string producer_name = producer->name();

  pacer::SteadyEventLoop loop;
  pacer::JsonlEventSink sink;
  pacer::SessionRecorder recorder(loop, sink, cfg, args.config_path);
  pacer::ReaderSession session(loop, std::move(producer), cfg);
  ConsolePrinter printer(session);

  if (record) {
    const pacer::Status st = recorder.start(producer_name);
    if (!st.ok()) {
      std::cerr << st.message() << "\n";
      return 2;
    }
    session.add_playback_observer(&recorder);
    session.add_stream_observer(&recorder);
  }
  if (!args.quiet) session.add_playback_observer(&printer);

  // Ensure we always cancel timers, end the stream and close/flush the log.
  struct Guard {
    pacer::ReaderSession& s;
    pacer::SessionRecorder& r;
    ~Guard() {
      s.reset();
      r.stop();
      g_loop = nullptr;
    }
  } guard{session, recorder};

  g_loop = &loop;
  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  if (record) {
    std::cout << "Events: " << sink.path() << " (latest: " << sink.latest_path() << ")\n";
  }
  std::cout << "Producer: " << producer_name << "  base_wpm=" << cfg.timing.base_wpm << "\n\n";

  const pacer::Status st_proc = session.process_document(document);
  if (!st_proc.ok()) {
    std::cerr << st_proc.message() << "\n";
    return 2;
  }

  loop.run_until([&] { return !session.is_processing() && !session.is_playing(); });

  const bool interrupted = loop.stop_requested();
  if (interrupted && record) (void)recorder.emit_event("shutdown", "interrupted");

  const pacer::StreamSummary& summary = session.stream_summary();
  std::cout << "\nChunks: " << session.total_chunks() << " (rejected " << summary.rejected
            << ", stream " << pacer::to_string(summary.end) << ")"
            << "  avg " << session.dynamic_wpm() << " wpm\n";

  if (summary.end == pacer::StreamEnd::kFailed) {
    std::cerr << summary.status.message() << "\n";
    return 2;
  }
  if (record && !recorder.status().ok()) return 2;

  if (!interrupted) std::cout << "OK\n";
  return 0;
}
