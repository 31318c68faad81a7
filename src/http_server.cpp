#include "http_server.hpp"

#include <utility>

#include "bridge_session.hpp"
#include "protocol.hpp"
#include "sync_error.hpp"
#include "websocket.hpp"

namespace {

std::string take_prefix(asio::streambuf& buf, std::size_t n) {
  auto begin = asio::buffers_begin(buf.data());
  std::string out(begin, begin + static_cast<std::ptrdiff_t>(n));
  buf.consume(n);
  return out;
}

bool wants_keep_alive(const HttpRequest& request) {
  auto connection = to_lower(request.header("connection").value_or(""));
  if(request.version == "HTTP/1.0") {
    return connection.find("keep-alive") != std::string::npos;
  }
  return connection.find("close") == std::string::npos;
}

} // namespace

std::shared_ptr<HttpSession> HttpSession::create(asio::ip::tcp::socket socket,
                                                 std::shared_ptr<SyncApi> api,
                                                 std::shared_ptr<MachineRegistry> registry,
                                                 std::shared_ptr<Logger> logger) {
  return std::shared_ptr<HttpSession>(
    new HttpSession(std::move(socket), std::move(api), std::move(registry), std::move(logger)));
}

HttpSession::HttpSession(asio::ip::tcp::socket socket,
                         std::shared_ptr<SyncApi> api,
                         std::shared_ptr<MachineRegistry> registry,
                         std::shared_ptr<Logger> logger)
  : socket_(std::move(socket)),
    api_(std::move(api)),
    registry_(std::move(registry)),
    logger_(std::move(logger)),
    read_buf_(kMaxHeaderBytes + kMaxBodyBytes) {}

void HttpSession::start() {
  do_read_head();
}

void HttpSession::do_read_head() {
  auto self = shared_from_this();
  asio::async_read_until(socket_, read_buf_, "\r\n\r\n",
    [this, self](std::error_code ec, std::size_t head_size) {
      if(ec) {
        if(ec == asio::error::not_found) {
          fail(400, "request header too large");
        } else {
          close();
        }
        return;
      }
      HttpRequest request;
      try {
        request = parse_request_head(take_prefix(read_buf_, head_size));
        auto length = content_length(request.headers);
        do_read_body(std::move(request), length);
      } catch(const ValidationError& e) {
        fail(400, e.what());
      }
    });
}

void HttpSession::do_read_body(HttpRequest request, std::size_t length) {
  if(read_buf_.size() >= length) {
    request.body = take_prefix(read_buf_, length);
    dispatch(std::move(request));
    return;
  }
  auto self = shared_from_this();
  auto shared_request = std::make_shared<HttpRequest>(std::move(request));
  asio::async_read(socket_, read_buf_, asio::transfer_exactly(length - read_buf_.size()),
    [this, self, shared_request, length](std::error_code ec, std::size_t) {
      if(ec) {
        logger_->debug("Body read failed: {}", ec.message());
        close();
        return;
      }
      shared_request->body = take_prefix(read_buf_, length);
      dispatch(std::move(*shared_request));
    });
}

void HttpSession::dispatch(HttpRequest request) {
  if(request.path() == kBridgeChannelPath && is_websocket_upgrade(request)) {
    upgrade(request);
    return;
  }
  auto response = api_->handle(request);
  write_response(response, wants_keep_alive(request));
}

void HttpSession::upgrade(const HttpRequest& request) {
  try {
    api_->authorize(request);
  } catch(const SyncError& e) {
    logger_->warn("Refused bridge channel upgrade: {}", e.what());
    write_response(SyncApi::error_response(e), false);
    return;
  }

  auto self = shared_from_this();
  write_buf_ = serialize(make_upgrade_response(request));
  asio::async_write(socket_, asio::buffer(write_buf_),
    [this, self](std::error_code ec, std::size_t) {
      if(ec) {
        close();
        return;
      }
      auto leftover = take_prefix(read_buf_, read_buf_.size());
      BridgeSession::start(std::move(socket_), std::move(leftover), registry_, logger_->child("channel"));
    });
}

void HttpSession::write_response(const HttpResponse& response, bool keep_alive) {
  HttpResponse out = response;
  out.set_header("connection", keep_alive ? "keep-alive" : "close");
  write_buf_ = serialize(out);
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(write_buf_),
    [this, self, keep_alive](std::error_code ec, std::size_t) {
      if(ec || !keep_alive) {
        close();
        return;
      }
      do_read_head();
    });
}

void HttpSession::fail(int status, const std::string& message) {
  auto response = make_json_response(status, dump_json(make_error_body("invalid_request", message)));
  write_response(response, false);
}

void HttpSession::close() {
  std::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

HttpServer::HttpServer(asio::io_context& io,
                       std::shared_ptr<SyncApi> api,
                       std::shared_ptr<MachineRegistry> registry,
                       std::shared_ptr<Logger> logger)
  : io_(io),
    api_(std::move(api)),
    registry_(std::move(registry)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("http")) {}

void HttpServer::listen(const std::string& ip, std::uint16_t port) {
  using tcp = asio::ip::tcp;
  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(ip);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", ip, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, port);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  port_ = acceptor_->local_endpoint().port();
  logger_->info("Listening on {}:{}", ip, port_);
  start_accept();
}

void HttpServer::start_accept() {
  if(!acceptor_ || !acceptor_->is_open()) return;
  acceptor_->async_accept(asio::make_strand(io_),
    [this](std::error_code ec, asio::ip::tcp::socket socket) {
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        logger_->warn("Accept failed: {}", ec.message());
      } else {
        HttpSession::create(std::move(socket), api_, registry_, logger_)->start();
      }
      start_accept();
    });
}

void HttpServer::stop() {
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
}
