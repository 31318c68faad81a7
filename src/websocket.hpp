#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "http_message.hpp"

// RFC 6455 framing for the bridge command channel. Text frames carry one JSON
// message each; fragmented messages are reassembled by the decoder.

enum class WsOpcode : std::uint8_t {
  Continuation = 0x0,
  Text = 0x1,
  Binary = 0x2,
  Close = 0x8,
  Ping = 0x9,
  Pong = 0xA
};

struct WsFrame {
  WsOpcode opcode = WsOpcode::Text;
  std::string payload;
};

std::string websocket_accept_key(const std::string& client_key);
std::string make_websocket_key();

// True when the request asks for a websocket upgrade with a usable key.
bool is_websocket_upgrade(const HttpRequest& request);
HttpResponse make_upgrade_response(const HttpRequest& request);

// Client frames must be masked, server frames must not be.
std::string encode_frame(WsOpcode opcode, const std::string& payload, bool masked);
std::string encode_close_frame(std::uint16_t code, const std::string& reason, bool masked);

class WsFrameDecoder {
public:
  // require_masked: set on the server side, where unmasked frames are a
  // protocol error.
  explicit WsFrameDecoder(bool require_masked, std::size_t max_message = kMaxBodyBytes);

  void append(const char* data, std::size_t size);

  // Next control frame or complete data message; std::nullopt when more
  // bytes are needed. Throws ValidationError on protocol violations.
  std::optional<WsFrame> next();

  std::size_t buffered() const { return buffer_.size(); }

private:
  bool require_masked_;
  std::size_t max_message_;
  std::string buffer_;
  std::optional<WsOpcode> partial_opcode_;
  std::string partial_;
};
