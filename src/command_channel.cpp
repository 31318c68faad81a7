#include "command_channel.hpp"

#include <exception>
#include <iterator>
#include <system_error>

using asio::ip::tcp;

std::shared_ptr<CommandChannel> CommandChannel::create(ServerUrl url,
                                                       std::shared_ptr<asio::ssl::context> tls,
                                                       std::shared_ptr<BridgeIdentity> identity,
                                                       CommandHandler handler,
                                                       DepthSource queue_depth,
                                                       Options options,
                                                       std::shared_ptr<Logger> logger) {
  return std::shared_ptr<CommandChannel>(new CommandChannel(std::move(url), std::move(tls), std::move(identity),
                                                            std::move(handler), std::move(queue_depth),
                                                            options, std::move(logger)));
}

CommandChannel::CommandChannel(ServerUrl url,
                               std::shared_ptr<asio::ssl::context> tls,
                               std::shared_ptr<BridgeIdentity> identity,
                               CommandHandler handler,
                               DepthSource queue_depth,
                               Options options,
                               std::shared_ptr<Logger> logger)
  : url_(std::move(url)),
    tls_(std::move(tls)),
    identity_(std::move(identity)),
    handler_(std::move(handler)),
    queue_depth_(std::move(queue_depth)),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("channel")),
    resolver_(io_),
    heartbeat_timer_(io_),
    reconnect_timer_(io_),
    connect_timer_(io_) {
  if(url_.tls() && !tls_) {
    tls_ = make_tls_context();
  }
}

CommandChannel::~CommandChannel() {
  stopping_ = true;
  work_.reset();
  io_.stop();
  if(thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  } else if(thread_.joinable()) {
    thread_.detach();
  }
}

void CommandChannel::start() {
  if(thread_.joinable()) return;
  stopping_ = false;
  work_ = std::make_unique<asio::executor_work_guard<asio::io_context::executor_type>>(io_.get_executor());
  asio::post(io_, [self = shared_from_this()]{ self->connect(); });
  thread_ = std::thread([this]{ io_.run(); });
}

void CommandChannel::stop() {
  if(stopping_.exchange(true)) return;

  std::list<std::future<void>> workers;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers.swap(workers_);
  }
  for(auto& worker : workers) {
    worker.wait();
  }

  if(!thread_.joinable()) return;
  asio::post(io_, [self = shared_from_this()]{
    self->reconnect_timer_.cancel();
    self->close_connection();
  });
  work_.reset();
  thread_.join();
  io_.restart();
}

void CommandChannel::connect() {
  if(stopping_) return;
  auto conn = std::make_shared<Connection>(io_, url_, url_.tls() ? tls_ : nullptr);
  conn_ = conn;
  auto self = shared_from_this();

  connect_timer_.expires_after(options_.connect_timeout);
  connect_timer_.async_wait([self, conn](const std::error_code& ec) {
    if(ec || conn != self->conn_ || self->connected_) return;
    self->fail(conn, "connect timed out");
  });

  logger_->debug("Connecting to {}{}", url_.host_header(), kBridgeChannelPath);
  resolver_.async_resolve(url_.host, url_.port,
    [self, conn](const std::error_code& ec, tcp::resolver::results_type results) {
      if(conn != self->conn_) return;
      if(ec) {
        self->fail(conn, "resolve: " + ec.message());
        return;
      }
      conn->stream.async_connect(results, [self, conn](const std::error_code& ec, const tcp::endpoint&) {
        if(conn != self->conn_) return;
        if(ec) {
          self->fail(conn, "connect: " + ec.message());
          return;
        }
        conn->stream.async_handshake([self, conn](const std::error_code& ec) {
          if(conn != self->conn_) return;
          if(ec) {
            self->fail(conn, "tls handshake: " + ec.message());
            return;
          }
          self->send_upgrade(conn);
        });
      });
    });
}

void CommandChannel::send_upgrade(const ConnectionPtr& conn) {
  conn->handshake_key = make_websocket_key();

  HttpRequest request;
  request.method = "GET";
  request.target = url_.target(kBridgeChannelPath);
  request.set_header("host", url_.host_header());
  request.set_header("upgrade", "websocket");
  request.set_header("connection", "Upgrade");
  request.set_header("sec-websocket-key", conn->handshake_key);
  request.set_header("sec-websocket-version", "13");
  apply_credentials(request, *identity_);

  auto wire = std::make_shared<std::string>(serialize(request));
  auto self = shared_from_this();
  conn->stream.async_write(asio::buffer(*wire), [self, conn, wire](const std::error_code& ec, std::size_t) {
    if(conn != self->conn_) return;
    if(ec) {
      self->fail(conn, "upgrade write: " + ec.message());
      return;
    }
    self->read_upgrade(conn);
  });
}

void CommandChannel::read_upgrade(const ConnectionPtr& conn) {
  auto self = shared_from_this();
  conn->stream.async_read_until(conn->handshake, "\r\n\r\n",
    [self, conn](const std::error_code& ec, std::size_t head_size) {
      if(conn != self->conn_) return;
      if(ec) {
        self->fail(conn, "upgrade read: " + ec.message());
        return;
      }
      std::string data(asio::buffers_begin(conn->handshake.data()), asio::buffers_end(conn->handshake.data()));
      conn->handshake.consume(conn->handshake.size());

      HttpResponse response;
      try {
        response = parse_response_head(data.substr(0, head_size));
      } catch(const SyncError& e) {
        self->fail(conn, std::string("upgrade response: ") + e.what());
        return;
      }
      if(response.status != 101) {
        self->fail(conn, "upgrade rejected with status " + std::to_string(response.status));
        return;
      }
      auto accept = response.header("sec-websocket-accept");
      if(!accept || *accept != websocket_accept_key(conn->handshake_key)) {
        self->fail(conn, "upgrade response has a bad accept key");
        return;
      }
      auto leftover = data.substr(head_size);
      if(!leftover.empty()) {
        conn->decoder.append(leftover.data(), leftover.size());
      }
      self->on_open(conn);
    });
}

void CommandChannel::on_open(const ConnectionPtr& conn) {
  connect_timer_.cancel();
  connected_ = true;
  ++connections_;
  logger_->info("Command channel connected to {}", url_.host_header());

  HelloMessage hello;
  hello.machine_id = identity_->machine_id();
  hello.machine_label = identity_->label();
  hello.version = kProtocolVersion;
  send_message(BridgeMessage{hello});

  schedule_heartbeat(conn);
  drain_frames(conn);
  if(conn == conn_) {
    do_read(conn);
  }
}

void CommandChannel::do_read(const ConnectionPtr& conn) {
  auto self = shared_from_this();
  conn->stream.async_read_some(asio::buffer(conn->read_buf),
    [self, conn](const std::error_code& ec, std::size_t n) {
      if(conn != self->conn_) return;
      if(ec) {
        self->fail(conn, ec == asio::error::eof ? std::string("server closed the connection") : "read: " + ec.message());
        return;
      }
      conn->decoder.append(conn->read_buf.data(), n);
      self->drain_frames(conn);
      if(conn == self->conn_) {
        self->do_read(conn);
      }
    });
}

void CommandChannel::drain_frames(const ConnectionPtr& conn) {
  try {
    while(conn == conn_) {
      auto frame = conn->decoder.next();
      if(!frame) break;
      switch(frame->opcode) {
        case WsOpcode::Text:
          handle_text(frame->payload);
          break;
        case WsOpcode::Ping:
          send_frame(conn, encode_frame(WsOpcode::Pong, frame->payload, true));
          break;
        case WsOpcode::Close: {
          std::string reason = "server closed the channel";
          if(frame->payload.size() >= 2) {
            auto code = (static_cast<unsigned char>(frame->payload[0]) << 8) |
                        static_cast<unsigned char>(frame->payload[1]);
            reason += " (" + std::to_string(code);
            if(frame->payload.size() > 2) reason += " " + frame->payload.substr(2);
            reason += ")";
          }
          fail(conn, reason);
          return;
        }
        default:
          break;
      }
    }
  } catch(const SyncError& e) {
    fail(conn, std::string("protocol error: ") + e.what());
  }
}

void CommandChannel::handle_text(const std::string& text) {
  PendingCommand command;
  try {
    command = decode_message<PendingCommand>(text);
  } catch(const ValidationError& e) {
    logger_->warn("Ignoring malformed command: {}", e.what());
    return;
  }
  logger_->debug("Received {} ({})", command.command.type_name(), command.id);
  run_command(std::move(command));
}

void CommandChannel::run_command(PendingCommand command) {
  if(stopping_) return;
  std::weak_ptr<CommandChannel> weak = shared_from_this();
  auto handler = handler_;
  auto logger = logger_;

  std::lock_guard<std::mutex> lock(workers_mutex_);
  for(auto it = workers_.begin(); it != workers_.end();) {
    if(it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
      it = workers_.erase(it);
    } else {
      ++it;
    }
  }
  workers_.push_back(std::async(std::launch::async, [weak, handler, logger, command = std::move(command)]{
    CommandResult result;
    try {
      result = handler(command);
    } catch(const std::exception& e) {
      logger->error("Command {} threw: {}", command.id, e.what());
      result.command_id = command.id;
      result.status = kResultError;
      result.message = e.what();
    }
    if(auto self = weak.lock()) {
      asio::post(self->io_, [self, result]{ self->send_result(result); });
    }
  }));
}

void CommandChannel::send_result(const CommandResult& result) {
  if(!connected_) {
    logger_->warn("Channel down, dropping result for {}; the server will redeliver it", result.command_id);
    return;
  }
  logger_->debug("Result {} for {}", result.status, result.command_id);
  send_message(BridgeMessage{result});
}

void CommandChannel::send_message(const BridgeMessage& message) {
  if(!conn_) return;
  send_frame(conn_, encode_frame(WsOpcode::Text, dump_json(json(message)), true));
}

void CommandChannel::send_frame(const ConnectionPtr& conn, std::string frame) {
  conn->write_queue.push_back(std::move(frame));
  if(conn->write_queue.size() == 1) {
    do_write(conn);
  }
}

void CommandChannel::do_write(const ConnectionPtr& conn) {
  auto self = shared_from_this();
  conn->stream.async_write(asio::buffer(conn->write_queue.front()),
    [self, conn](const std::error_code& ec, std::size_t) {
      if(conn != self->conn_) return;
      if(ec) {
        self->fail(conn, "write: " + ec.message());
        return;
      }
      conn->write_queue.pop_front();
      if(!conn->write_queue.empty()) {
        self->do_write(conn);
      }
    });
}

void CommandChannel::schedule_heartbeat(const ConnectionPtr& conn) {
  auto self = shared_from_this();
  heartbeat_timer_.expires_after(options_.heartbeat_interval);
  heartbeat_timer_.async_wait([self, conn](const std::error_code& ec) {
    if(ec || conn != self->conn_ || !self->connected_) return;
    ChannelHeartbeat heartbeat;
    heartbeat.queue_depth = self->queue_depth_ ? self->queue_depth_() : 0;
    self->send_message(BridgeMessage{heartbeat});
    self->schedule_heartbeat(conn);
  });
}

void CommandChannel::fail(const ConnectionPtr& conn, const std::string& reason) {
  if(conn != conn_) return;
  if(stopping_) {
    close_connection();
    return;
  }
  logger_->warn("Bridge disconnected: {}; reconnecting in {} ms", reason, options_.reconnect_delay.count());
  close_connection();

  auto self = shared_from_this();
  reconnect_timer_.expires_after(options_.reconnect_delay);
  reconnect_timer_.async_wait([self](const std::error_code& ec) {
    if(ec) return;
    self->connect();
  });
}

void CommandChannel::close_connection() {
  connected_ = false;
  heartbeat_timer_.cancel();
  connect_timer_.cancel();
  resolver_.cancel();
  if(conn_) {
    conn_->stream.close();
    conn_.reset();
  }
}
