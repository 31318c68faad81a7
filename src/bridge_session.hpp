#pragma once

#include <asio.hpp>

#include <array>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>

#include "log.hpp"
#include "machine_registry.hpp"
#include "websocket.hpp"

// Server end of one bridge command channel, after the HTTP upgrade. The
// socket's executor is a strand, so every handler here and every deliver()
// posted from the registry run serialised.
class BridgeSession : public CommandSink,
                      public std::enable_shared_from_this<BridgeSession> {
public:
  static std::shared_ptr<BridgeSession> start(asio::ip::tcp::socket socket,
                                              std::string leftover,
                                              std::shared_ptr<MachineRegistry> registry,
                                              std::shared_ptr<Logger> logger);

  ~BridgeSession() override;

  void deliver(const PendingCommand& command) override;
  void close() override;

  const std::string& machine_id() const { return machine_id_; }

private:
  BridgeSession(asio::ip::tcp::socket socket,
                std::shared_ptr<MachineRegistry> registry,
                std::shared_ptr<Logger> logger);

  void do_read();
  void drain_frames();
  void handle_text(const std::string& text);
  void handle_hello(const HelloMessage& hello);
  void send_frame(std::string frame);
  void do_write();
  void close_with(std::uint16_t code, const std::string& reason);
  void shutdown();

  asio::ip::tcp::socket socket_;
  std::shared_ptr<MachineRegistry> registry_;
  std::shared_ptr<Logger> logger_;
  WsFrameDecoder decoder_{true};
  std::array<char, 8192> read_buf_{};
  std::deque<std::string> write_queue_;
  std::string machine_id_;
  bool closing_ = false;
  bool closed_ = false;
};
