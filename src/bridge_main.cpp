#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>

#include "bridge_agent.hpp"
#include "bridge_config.hpp"
#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv) {
  try {
    auto settings = std::make_shared<SettingsManager>(BRIDGE_SETTINGS_SPECIFICATION);

    CommandLineParser parser("specsync-bridge", "sync local spec directories with a specsync server",
                             BRIDGE_SETTINGS_SPECIFICATION);
    if(!parser.parse(argc, argv, *settings)) {
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    auto config_dir = settings->get<std::string>("config_dir");
    std::filesystem::path log_dir = config_dir.empty() ? BridgeAgent::default_config_dir()
                                                       : std::filesystem::path(config_dir);
    std::error_code ec;
    std::filesystem::create_directories(log_dir, ec);
    init(settings->get<bool>("verbose"), ec ? std::filesystem::path() : log_dir / "bridge.log");

    BridgeAgent agent(settings);
    auto logger = agent.logger();
    logger->debug("Verbose logging enabled");

    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signo) {
      if(ec) return;
      logger->info("Signal {} received, shutting down", signo);
      agent.request_stop();
    });
    std::thread signal_thread([&]{ signal_io.run(); });

    int status = 0;
    try {
      agent.run();
    } catch(const ConfigError& e) {
      logger->error("{}", e.what());
      status = 2;
    }

    signal_io.stop();
    if(signal_thread.joinable()) {
      signal_thread.join();
    }
    agent.stop();
    return status;
  } catch(std::exception& e) {
    init(false);
    Logger logger("specsync-bridge");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
