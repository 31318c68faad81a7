#pragma once

#include <asio.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "bridge_config.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "transport.hpp"
#include "websocket.hpp"

// Bridge end of the command channel. Runs its own io_context thread: connect,
// upgrade, Hello, then read commands and write results and heartbeats. Any
// failure drops the connection and reconnects after a fixed delay. Commands
// execute on worker threads; their results are posted back to the channel.
class CommandChannel : public std::enable_shared_from_this<CommandChannel> {
public:
  using CommandHandler = std::function<CommandResult(const PendingCommand&)>;
  using DepthSource = std::function<std::size_t()>;

  struct Options {
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(10)};
    std::chrono::milliseconds reconnect_delay{std::chrono::seconds(5)};
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(15)};
  };

  static std::shared_ptr<CommandChannel> create(ServerUrl url,
                                                std::shared_ptr<asio::ssl::context> tls,
                                                std::shared_ptr<BridgeIdentity> identity,
                                                CommandHandler handler,
                                                DepthSource queue_depth,
                                                Options options,
                                                std::shared_ptr<Logger> logger);
  ~CommandChannel();

  void start();
  // Waits for running commands, then closes the connection and joins the
  // io thread.
  void stop();

  bool connected() const { return connected_; }
  std::size_t connections() const { return connections_; }

private:
  struct Connection {
    Connection(asio::io_context& io, const ServerUrl& url, std::shared_ptr<asio::ssl::context> tls)
      : stream(io, url, std::move(tls)) {}

    ClientStream stream;
    asio::streambuf handshake{kMaxHeaderBytes};
    std::string handshake_key;
    WsFrameDecoder decoder{false};
    std::array<char, 8192> read_buf{};
    std::deque<std::string> write_queue;
  };
  using ConnectionPtr = std::shared_ptr<Connection>;

  CommandChannel(ServerUrl url,
                 std::shared_ptr<asio::ssl::context> tls,
                 std::shared_ptr<BridgeIdentity> identity,
                 CommandHandler handler,
                 DepthSource queue_depth,
                 Options options,
                 std::shared_ptr<Logger> logger);

  void connect();
  void send_upgrade(const ConnectionPtr& conn);
  void read_upgrade(const ConnectionPtr& conn);
  void on_open(const ConnectionPtr& conn);
  void do_read(const ConnectionPtr& conn);
  void drain_frames(const ConnectionPtr& conn);
  void handle_text(const std::string& text);
  void run_command(PendingCommand command);
  void send_result(const CommandResult& result);
  void send_message(const BridgeMessage& message);
  void send_frame(const ConnectionPtr& conn, std::string frame);
  void do_write(const ConnectionPtr& conn);
  void schedule_heartbeat(const ConnectionPtr& conn);
  void fail(const ConnectionPtr& conn, const std::string& reason);
  void close_connection();

  ServerUrl url_;
  std::shared_ptr<asio::ssl::context> tls_;
  std::shared_ptr<BridgeIdentity> identity_;
  CommandHandler handler_;
  DepthSource queue_depth_;
  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::unique_ptr<asio::executor_work_guard<asio::io_context::executor_type>> work_;
  std::thread thread_;
  asio::ip::tcp::resolver resolver_;
  asio::steady_timer heartbeat_timer_;
  asio::steady_timer reconnect_timer_;
  asio::steady_timer connect_timer_;
  ConnectionPtr conn_;

  std::atomic<bool> connected_{false};
  std::atomic<bool> stopping_{false};
  std::atomic<std::size_t> connections_{0};

  std::mutex workers_mutex_;
  std::list<std::future<void>> workers_;
};
