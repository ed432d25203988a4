#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace {
constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kFilePattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v";

std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::mutex g_setup_mutex;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            const char* pattern) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

// Caller holds g_setup_mutex.
void create_loggers_locked() {
  if(g_info_logger) return;

  g_info_logger = make_logger("archdiff.info",
                              std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                              kTimestampPattern);
  g_error_logger = make_logger("archdiff.error",
                               std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                               kTimestampPattern);
  g_print_logger = make_logger("archdiff.print",
                               std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                               "%v");
  g_print_err_logger = make_logger("archdiff.print_err",
                                   std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                   "%v");

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_loggers_locked();
}

void attach_file_sink_locked(const std::filesystem::path& log_file) {
  if(g_file_sink || log_file.empty()) return;
  std::error_code ec;
  if(log_file.has_parent_path()) {
    std::filesystem::create_directories(log_file.parent_path(), ec);
  }
  g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
  g_file_sink->set_pattern(kFilePattern);
  for(auto* logger : {&g_info_logger, &g_error_logger, &g_print_logger, &g_print_err_logger}) {
    (*logger)->sinks().push_back(g_file_sink);
  }
}

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

spdlog::logger* sink_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Print: return g_print_logger.get();
    case LogChannel::PrintErr: return g_print_err_logger.get();
    case LogChannel::Error: return g_error_logger.get();
    default: return g_info_logger.get();
  }
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose, const std::filesystem::path& log_file) {
  std::lock_guard<std::mutex> lock(g_setup_mutex);
  create_loggers_locked();
  attach_file_sink_locked(log_file);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

Logger::Logger() = default;
Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::reset_counters() {
  warnings_.store(0, std::memory_order_relaxed);
}

void Logger::emit(LogChannel channel, const std::string& message) {
  if(channel == LogChannel::Warn) warnings_.fetch_add(1, std::memory_order_relaxed);

  const char* base = channel_name(channel);
  std::string label = name_.empty() ? std::string(base) : name_ + ":" + base;
  if(dispatch(label, detail::level_for(channel), message)) return;
  detail::emit_to_default(channel, label, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, "listener",
                              fmt::format("log listener failed: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    default: return spdlog::level::info;
  }
}

void emit_to_default(LogChannel channel,
                     const std::string& channel_label,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = sink_for(channel);
  if(!sink) return;
  const char* base = channel_name(channel);
  const bool plain = channel == LogChannel::Print || channel == LogChannel::PrintErr;
  if(!plain && !channel_label.empty() && channel_label != base) {
    sink->log(level_for(channel), fmt::format("[{}] {}", channel_label, message));
  } else {
    sink->log(level_for(channel), message);
  }
}

} // namespace detail
