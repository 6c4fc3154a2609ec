#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {

constexpr const char* kStampedPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::mutex g_logger_mutex;
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            spdlog::sink_ptr sink,
                                            const char* pattern,
                                            spdlog::level::level_enum flush_level) {
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  logger->flush_on(flush_level);
  return logger;
}

// Caller holds g_logger_mutex.
void create_loggers_locked() {
  if(g_info_logger) return;
  g_info_logger = make_logger("dsync.info",
                              std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                              kStampedPattern, spdlog::level::warn);
  g_error_logger = make_logger("dsync.error",
                               std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                               kStampedPattern, spdlog::level::err);
  g_print_logger = make_logger("dsync.print",
                               std::make_shared<spdlog::sinks::stdout_color_sink_mt>(),
                               "%v", spdlog::level::info);
  g_print_err_logger = make_logger("dsync.print_err",
                                   std::make_shared<spdlog::sinks::stderr_color_sink_mt>(),
                                   "%v", spdlog::level::err);
}

spdlog::logger* sink_for(LogChannel channel) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  create_loggers_locked();
  switch(channel) {
    case LogChannel::Print: return g_print_logger.get();
    case LogChannel::PrintErr: return g_print_err_logger.get();
    case LogChannel::Error: return g_error_logger.get();
    default: return g_info_logger.get();
  }
}

} // namespace

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

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    default: return spdlog::level::info;
  }
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

void init_logging(bool verbose, const std::filesystem::path& log_file) {
  std::lock_guard<std::mutex> lock(g_logger_mutex);
  create_loggers_locked();

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  if(!log_file.empty() && !g_file_sink) {
    std::error_code ec;
    if(log_file.has_parent_path()) {
      std::filesystem::create_directories(log_file.parent_path(), ec);
    }
    g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string());
    g_file_sink->set_pattern(kStampedPattern);
    g_file_sink->set_level(spdlog::level::debug);
    g_info_logger->sinks().push_back(g_file_sink);
    g_error_logger->sinks().push_back(g_file_sink);
  }

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::write(LogChannel channel, const std::string& message) {
  const std::string label = name_.empty()
    ? std::string(channel_name(channel))
    : name_ + ":" + channel_name(channel);
  if(dispatch(label, channel_level(channel), message)) return;
  detail::emit(channel, label, message);
}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

bool Logger::dispatch(const std::string& label,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& listener : snapshot) {
    try {
      if(listener(label, level, message)) handled = true;
    } catch(const std::exception& e) {
      detail::emit(LogChannel::Error, label, fmt::format("log listener failed: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

void emit(LogChannel channel, const std::string& label, const std::string& message) {
  if(!g_log_passthrough.load(std::memory_order_acquire)) return;
  auto* sink = sink_for(channel);
  if(!sink) return;
  if(label.empty() || channel == LogChannel::Print || channel == LogChannel::PrintErr) {
    sink->log(channel_level(channel), "{}", message);
  } else {
    sink->log(channel_level(channel), "[{}] {}", label, message);
  }
}

} // namespace detail
