#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Creates the process-wide sinks. Safe to call more than once; later calls
// only adjust the level and (re)attach the optional log file mirror.
void init(bool verbose = false, const std::filesystem::path& log_file = {});
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

enum class LogChannel {
  Debug,
  Info,
  Warn,
  Error,
  Print,
  PrintErr
};

class Logger {
public:
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger();
  explicit Logger(std::string name);

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  // Counts survive listener interception so a run can report how many
  // transient problems it recovered from.
  std::uint64_t warning_count() const { return warnings_.load(std::memory_order_relaxed); }
  void reset_counters();

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void emit(LogChannel channel, const std::string& message);

private:
  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
  std::atomic<std::uint64_t> warnings_{0};
};

namespace detail {
spdlog::level::level_enum level_for(LogChannel channel);
void emit_to_default(LogChannel channel,
                     const std::string& channel_label,
                     const std::string& message);
} // namespace detail

// Free helpers for code that may or may not have been handed a Logger.
template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) logger->emit(LogChannel::Info, message);
  else detail::emit_to_default(LogChannel::Info, "info", message);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) logger->emit(LogChannel::Error, message);
  else detail::emit_to_default(LogChannel::Error, "error", message);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) logger->emit(LogChannel::Print, message);
  else detail::emit_to_default(LogChannel::Print, "print", message);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) logger->emit(LogChannel::PrintErr, message);
  else detail::emit_to_default(LogChannel::PrintErr, "print_err", message);
}
