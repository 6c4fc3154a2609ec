#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>

#include "command_line_parser.hpp"
#include "dsync_cli.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "rest_api_client.hpp"
#include "settings_manager.hpp"
#include "transfer_pool.hpp"

// Turns SIGINT/SIGTERM into a cancellation request for in-flight transfers.
class SignalWatcher {
public:
  SignalWatcher(CancellationToken& token, std::shared_ptr<Logger> logger)
    : signals_(io_, SIGINT, SIGTERM), guard_(asio::make_work_guard(io_)) {
    signals_.async_wait([&token, logger](const std::error_code& ec, int signal_number){
      if(ec) return;
      logger->warn("Received signal {}, cancelling pending transfers", signal_number);
      token.cancel();
    });
    thread_ = std::thread([this]{ io_.run(); });
  }

  ~SignalWatcher() {
    std::error_code ignored;
    signals_.cancel(ignored);
    guard_.reset();
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
  asio::io_context io_;
  asio::signal_set signals_;
  asio::executor_work_guard<asio::io_context::executor_type> guard_;
  std::thread thread_;
};

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(SettingsManager::default_config_root() / "settings.json");
    const bool loaded = settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? std::filesystem::path(argv[0]).filename().string() : "dsync");
    ParsedCommand command;
    try {
      command = parser.parse(argc, argv, *settings);
    } catch(const SyncError& e) {
      init_logging(false);
      print_err(nullptr, "Error: {}", describe(e.failure()));
      parser.usage(*settings);
      return 1;
    }

    init_logging(settings->get<bool>("verbose"), settings->get<std::string>("log_file"));
    auto logger = std::make_shared<Logger>("dsync");
    if(loaded) {
      logger->debug("Settings loaded from {}", settings->settings_path().string());
    } else {
      logger->debug("No settings at {}, using defaults", settings->settings_path().string());
    }

    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
        return 1;
      }
      logger->info("Settings saved to {}", settings->settings_path().string());
      if(command.words.empty()) return 0;
    }

    CancellationToken cancel;
    SignalWatcher watcher(cancel, logger);

    auto api_factory = [logger](const std::string& base_url, const std::string& api_key) {
      return std::make_shared<RestApiClient>(base_url, api_key, logger);
    };
    DsyncCLI cli(settings, logger, api_factory, &cancel);
    return cli.execute(command);
  } catch(std::exception& e) {
    init_logging(false);
    Logger logger("dsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
