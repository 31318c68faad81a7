#include "bridge_session.hpp"

#include "protocol.hpp"
#include "sync_error.hpp"

namespace {
constexpr std::uint16_t kCloseNormal = 1000;
constexpr std::uint16_t kCloseProtocolError = 1002;
constexpr std::uint16_t kClosePolicy = 1008;
} // namespace

std::shared_ptr<BridgeSession> BridgeSession::start(asio::ip::tcp::socket socket,
                                                    std::string leftover,
                                                    std::shared_ptr<MachineRegistry> registry,
                                                    std::shared_ptr<Logger> logger) {
  auto session = std::shared_ptr<BridgeSession>(
    new BridgeSession(std::move(socket), std::move(registry), std::move(logger)));
  auto executor = session->socket_.get_executor();
  asio::post(executor, [session, leftover = std::move(leftover)]{
    if(!leftover.empty()) {
      session->decoder_.append(leftover.data(), leftover.size());
      session->drain_frames();
    }
    session->do_read();
  });
  return session;
}

BridgeSession::BridgeSession(asio::ip::tcp::socket socket,
                             std::shared_ptr<MachineRegistry> registry,
                             std::shared_ptr<Logger> logger)
  : socket_(std::move(socket)),
    registry_(std::move(registry)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("channel")) {}

BridgeSession::~BridgeSession() {
  std::error_code ec;
  socket_.close(ec);
}

void BridgeSession::do_read() {
  if(closed_) return;
  auto self = shared_from_this();
  socket_.async_read_some(asio::buffer(read_buf_),
    [this, self](std::error_code ec, std::size_t bytes) {
      if(ec) {
        if(ec != asio::error::eof && ec != asio::error::operation_aborted) {
          logger_->info("Channel read error ({}): {}", machine_id_.empty() ? "anonymous" : machine_id_, ec.message());
        }
        shutdown();
        return;
      }
      decoder_.append(read_buf_.data(), bytes);
      drain_frames();
      do_read();
    });
}

void BridgeSession::drain_frames() {
  try {
    while(!closed_) {
      auto frame = decoder_.next();
      if(!frame) break;
      switch(frame->opcode) {
        case WsOpcode::Text:
          handle_text(frame->payload);
          break;
        case WsOpcode::Ping:
          send_frame(encode_frame(WsOpcode::Pong, frame->payload, false));
          break;
        case WsOpcode::Pong:
          break;
        case WsOpcode::Close:
          close_with(kCloseNormal, "");
          return;
        default:
          logger_->warn("Ignoring non-text frame from {}", machine_id_);
          break;
      }
    }
  } catch(const ValidationError& e) {
    logger_->warn("Protocol error on channel {}: {}", machine_id_, e.what());
    close_with(kCloseProtocolError, "protocol error");
  }
}

void BridgeSession::handle_text(const std::string& text) {
  BridgeMessage message;
  try {
    message = decode_message<BridgeMessage>(text);
  } catch(const ValidationError& e) {
    // A bad message is dropped; the connection stays usable.
    logger_->warn("Dropping malformed channel message: {}", e.what());
    return;
  }

  if(auto* hello = std::get_if<HelloMessage>(&message.body)) {
    handle_hello(*hello);
    return;
  }
  if(machine_id_.empty()) {
    logger_->warn("Channel message '{}' before hello, ignoring", message.type_name());
    return;
  }
  try {
    if(auto* beat = std::get_if<ChannelHeartbeat>(&message.body)) {
      logger_->debug("Heartbeat from {} (queue depth {})", machine_id_, beat->queue_depth);
      registry_->touch(machine_id_);
    } else if(auto* result = std::get_if<CommandResult>(&message.body)) {
      registry_->acknowledge(machine_id_, *result);
    }
  } catch(const SyncError& e) {
    logger_->error("Channel {} message '{}' failed: {}", machine_id_, message.type_name(), e.what());
  }
}

void BridgeSession::handle_hello(const HelloMessage& hello) {
  if(!machine_id_.empty() && machine_id_ != hello.machine_id) {
    logger_->warn("Channel for {} sent hello as {}, closing", machine_id_, hello.machine_id);
    close_with(kClosePolicy, "machine id changed");
    return;
  }
  std::vector<PendingCommand> pending;
  try {
    pending = registry_->hello(hello.machine_id, hello.machine_label, shared_from_this());
  } catch(const RevokedError&) {
    logger_->warn("Revoked machine {} tried to connect", hello.machine_id);
    close_with(kClosePolicy, "machine revoked");
    return;
  } catch(const SyncError& e) {
    logger_->error("Hello from {} failed: {}", hello.machine_id, e.what());
    close_with(kClosePolicy, "hello rejected");
    return;
  }
  machine_id_ = hello.machine_id;
  logger_->info("Machine {} ({}) connected, replaying {} pending command(s)",
                machine_id_, hello.machine_label, pending.size());
  for(const auto& command : pending) {
    send_frame(encode_frame(WsOpcode::Text, dump_json(json(command)), false));
  }
}

void BridgeSession::deliver(const PendingCommand& command) {
  auto self = shared_from_this();
  auto text = dump_json(json(command));
  asio::post(socket_.get_executor(), [this, self, text = std::move(text)]() mutable {
    send_frame(encode_frame(WsOpcode::Text, text, false));
  });
}

void BridgeSession::close() {
  auto self = shared_from_this();
  asio::post(socket_.get_executor(), [this, self]{
    close_with(kCloseNormal, "replaced");
  });
}

void BridgeSession::send_frame(std::string frame) {
  if(closed_ || closing_) return;
  bool idle = write_queue_.empty();
  write_queue_.push_back(std::move(frame));
  if(idle) do_write();
}

void BridgeSession::do_write() {
  if(write_queue_.empty()) {
    if(closing_) shutdown();
    return;
  }
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(write_queue_.front()),
    [this, self](std::error_code ec, std::size_t) {
      if(ec) {
        logger_->info("Channel write error ({}): {}", machine_id_, ec.message());
        shutdown();
        return;
      }
      write_queue_.pop_front();
      do_write();
    });
}

void BridgeSession::close_with(std::uint16_t code, const std::string& reason) {
  if(closing_ || closed_) return;
  bool idle = write_queue_.empty();
  write_queue_.push_back(encode_close_frame(code, reason, false));
  closing_ = true;
  if(idle) do_write();
}

void BridgeSession::shutdown() {
  if(closed_) return;
  closed_ = true;
  if(!machine_id_.empty()) {
    registry_->unregister_channel(machine_id_, this);
  }
  std::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}
