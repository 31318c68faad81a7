#pragma once

#include <asio.hpp>

#include <cstdint>
#include <memory>
#include <string>

#include "http_message.hpp"
#include "log.hpp"
#include "machine_registry.hpp"
#include "sync_api.hpp"

// One accepted HTTP connection. Requests are handled one at a time
// (keep-alive); a websocket upgrade on the bridge path hands the socket over to
// a BridgeSession.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  static std::shared_ptr<HttpSession> create(asio::ip::tcp::socket socket,
                                             std::shared_ptr<SyncApi> api,
                                             std::shared_ptr<MachineRegistry> registry,
                                             std::shared_ptr<Logger> logger);
  void start();

private:
  HttpSession(asio::ip::tcp::socket socket,
              std::shared_ptr<SyncApi> api,
              std::shared_ptr<MachineRegistry> registry,
              std::shared_ptr<Logger> logger);

  void do_read_head();
  void do_read_body(HttpRequest request, std::size_t length);
  void dispatch(HttpRequest request);
  void upgrade(const HttpRequest& request);
  void write_response(const HttpResponse& response, bool keep_alive);
  void fail(int status, const std::string& message);
  void close();

  asio::ip::tcp::socket socket_;
  std::shared_ptr<SyncApi> api_;
  std::shared_ptr<MachineRegistry> registry_;
  std::shared_ptr<Logger> logger_;
  asio::streambuf read_buf_;
  std::string write_buf_;
};

class HttpServer {
public:
  HttpServer(asio::io_context& io,
             std::shared_ptr<SyncApi> api,
             std::shared_ptr<MachineRegistry> registry,
             std::shared_ptr<Logger> logger = nullptr);

  // Binds and starts accepting. Port 0 picks an ephemeral port.
  void listen(const std::string& ip, std::uint16_t port);
  void stop();

  std::uint16_t port() const { return port_; }

private:
  void start_accept();

  asio::io_context& io_;
  std::shared_ptr<SyncApi> api_;
  std::shared_ptr<MachineRegistry> registry_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<asio::ip::tcp::acceptor> acceptor_;
  std::uint16_t port_ = 0;
};
