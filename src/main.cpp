#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>

#include "archive_reader.hpp"
#include "command_line_parser.hpp"
#include "comparison_session.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "report.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitCancelled = 130;

ComparisonSession::Options build_options(const SettingsManager& settings) {
  ComparisonSession::Options options;
  options.folder = settings.get<std::string>("folder");
  options.archive = settings.get<std::string>("archive");
  options.output = settings.get<std::string>("output");
  options.chunk_size = settings.get<std::size_t>("chunk_size");
  options.max_workers = settings.get<std::size_t>("workers");
  options.max_pending = settings.get<std::size_t>("max_pending");
  options.on_failure = Extractor::parse_policy(settings.get<std::string>("on_error"));
  options.dry_run = settings.get<bool>("dry_run");
  options.all_formats = settings.get<bool>("all_formats");
  return options;
}

// Single rewritten console line; the last update ends it with a newline.
void render_progress(const ProgressSnapshot& snap, bool final_update) {
  static std::mutex render_mutex;
  std::lock_guard<std::mutex> lock(render_mutex);
  if(snap.phase == ProgressPhase::Idle || snap.phase == ProgressPhase::Sizing) {
    if(final_update) std::cout << "\n" << std::flush;
    return;
  }
  std::string current = snap.current;
  if(current.size() > 40) {
    current = "..." + current.substr(current.size() - 37);
  }
  std::cout << "\r" << std::string(110, ' ') << "\r"
            << phase_label(snap.phase) << ": "
            << fmt::format("{:.2f}%", snap.percent())
            << " | " << format_size(static_cast<uint64_t>(snap.bytes_per_second())) << "/s"
            << " | " << format_size(snap.processed_bytes) << " / " << format_size(snap.total_bytes)
            << " | ETA " << format_duration(snap.eta())
            << " | " << current;
  if(final_update) std::cout << "\n";
  std::cout << std::flush;
}

} // namespace

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.set_settings_path(std::filesystem::current_path() / ".config" / "archdiff.json");
    settings.load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "archdiff");
    try {
      parser.parse(argc, argv, settings);
    } catch(const UsageError& e) {
      init(false);
      print_err(nullptr, "{}", e.what());
      parser.usage(settings);
      return kExitFailure;
    }
    if(settings.help_requested()) {
      parser.usage(settings);
      return kExitOk;
    }

    init(settings.get<bool>("verbose"), settings.get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("archdiff");
    if(settings.get<bool>("verbose")) {
      logger->debug("Verbose logging enabled");
    }

    if(settings.save_requested()) {
      if(!settings.save()) {
        logger->error("Unable to persist settings to {}", settings.settings_path().string());
      }
    }

    ComparisonSession session(build_options(settings), logger);

    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signal_number){
      if(ec) return;
      logger->warn("Received signal {}, cancelling...", signal_number);
      session.cancel();
    });
    std::thread signal_thread([&signal_io](){ signal_io.run(); });
    auto stop_signals = [&](){
      std::error_code ec;
      signals.cancel(ec);
      signal_io.stop();
      if(signal_thread.joinable()) signal_thread.join();
    };

    ComparisonResult result;
    try {
      std::unique_ptr<ProgressReporter> reporter;
      if(settings.get<bool>("progress")) {
        reporter = std::make_unique<ProgressReporter>(
          session.progress(),
          std::chrono::milliseconds(settings.get<int>("progress_interval_ms")),
          render_progress);
      }
      result = session.run();
      if(reporter) reporter->stop();
    } catch(const OperationCancelled&) {
      stop_signals();
      print_err(nullptr, "\nOperation cancelled by user.");
      return kExitCancelled;
    } catch(const ArchiveError& e) {
      stop_signals();
      logger->error("Archive error: {}", e.what());
      return kExitFailure;
    } catch(...) {
      stop_signals();
      throw;
    }
    stop_signals();

    render_report(result);

    auto json_path = settings.get<std::string>("json_report");
    if(!json_path.empty() && !write_json_report(result, json_path, logger.get())) {
      return kExitFailure;
    }
    return result.extraction.ok() ? kExitOk : kExitFailure;
  } catch(std::exception& e) {
    init(false);
    Logger logger("archdiff-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return kExitFailure;
  }
}
