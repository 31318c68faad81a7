#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_server.hpp"

int main(int argc, char** argv) {
  try {
    auto settings = std::make_shared<SettingsManager>(SERVER_SETTINGS_SPECIFICATION);
    settings->set_settings_path(SyncServer::default_state_dir() / "server-settings.json");
    settings->load();

    CommandLineParser parser("specsync-server", "spec sync registry and bridge command server",
                             SERVER_SETTINGS_SPECIFICATION);
    if(!parser.parse(argc, argv, *settings)) {
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"));
    SyncServer server(settings);
    auto logger = server.logger();
    logger->debug("Verbose logging enabled");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    server.start();

    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signo) {
      if(ec) return;
      logger->info("Signal {} received, shutting down", signo);
      server.request_stop();
    });
    std::thread signal_thread([&]{ signal_io.run(); });

    logger->print("specsync-server listening on {}:{}",
                  settings->get<std::string>("listen_ip"), server.listen_port());
    server.run();

    signal_io.stop();
    if(signal_thread.joinable()) {
      signal_thread.join();
    }
    server.stop();
    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("specsync-server");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
