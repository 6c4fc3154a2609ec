#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Diagnostics go to stamped loggers; print channels are bare command output.
enum class LogChannel { Debug, Info, Warn, Error, Print, PrintErr };

const char* channel_name(LogChannel channel);
spdlog::level::level_enum channel_level(LogChannel channel);

// Sets up the four console sinks; a non-empty log_file also receives
// every diagnostic line.
void init_logging(bool verbose = false,
                  const std::filesystem::path& log_file = std::filesystem::path());

// Disabled by the test runner so only listeners see output.
void set_log_passthrough(bool enabled);

using LogListenerHandle = std::size_t;

namespace detail {
void emit(LogChannel channel, const std::string& label, const std::string& message);
} // namespace detail

// Named front end over the shared sinks. Listeners see "<name>:<channel>" and
// may claim a line by returning true, which keeps it off the console.
class Logger {
public:
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name);

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Error, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::Print, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    write(LogChannel::PrintErr, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void write(LogChannel channel, const std::string& message);

private:
  bool dispatch(const std::string& label, spdlog::level::level_enum level, const std::string& message);

  const std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

// Command output for code that may run without a Logger (usage text, settings load).
template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) logger->write(LogChannel::Print, message);
  else detail::emit(LogChannel::Print, std::string(), message);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  auto message = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) logger->write(LogChannel::PrintErr, message);
  else detail::emit(LogChannel::PrintErr, std::string(), message);
}
