#include "websocket.hpp"

#include <cstring>
#include <vector>

#include "sync_error.hpp"
#include "utils.hpp"

namespace {
constexpr const char* kWsGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

bool is_control(WsOpcode opcode) {
  return (static_cast<std::uint8_t>(opcode) & 0x8) != 0;
}

bool header_has_token(const std::optional<std::string>& value, const std::string& token) {
  if(!value) return false;
  std::string lowered = to_lower(*value);
  std::size_t start = 0;
  while(start <= lowered.size()) {
    auto comma = lowered.find(',', start);
    auto item = trim_copy(lowered.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
    if(item == token) return true;
    if(comma == std::string::npos) break;
    start = comma + 1;
  }
  return false;
}

} // namespace

std::string websocket_accept_key(const std::string& client_key) {
  auto digest = sha1_bytes(trim_copy(client_key) + kWsGuid);
  return base64_encode(digest);
}

std::string make_websocket_key() {
  return base64_encode(random_bytes(16));
}

bool is_websocket_upgrade(const HttpRequest& request) {
  return request.method == "GET" &&
         header_has_token(request.header("connection"), "upgrade") &&
         iequals(request.header("upgrade").value_or(""), "websocket") &&
         !request.header("sec-websocket-key").value_or("").empty();
}

HttpResponse make_upgrade_response(const HttpRequest& request) {
  HttpResponse response;
  response.status = 101;
  response.set_header("upgrade", "websocket");
  response.set_header("connection", "Upgrade");
  response.set_header("sec-websocket-accept",
                      websocket_accept_key(request.header("sec-websocket-key").value_or("")));
  return response;
}

std::string encode_frame(WsOpcode opcode, const std::string& payload, bool masked) {
  std::string frame;
  frame.reserve(payload.size() + 14);
  frame.push_back(static_cast<char>(0x80 | static_cast<std::uint8_t>(opcode)));

  const std::uint8_t mask_bit = masked ? 0x80 : 0x00;
  if(payload.size() < 126) {
    frame.push_back(static_cast<char>(mask_bit | payload.size()));
  } else if(payload.size() <= 0xFFFF) {
    frame.push_back(static_cast<char>(mask_bit | 126));
    frame.push_back(static_cast<char>((payload.size() >> 8) & 0xFF));
    frame.push_back(static_cast<char>(payload.size() & 0xFF));
  } else {
    frame.push_back(static_cast<char>(mask_bit | 127));
    for(int i = 7; i >= 0; --i) {
      frame.push_back(static_cast<char>((static_cast<std::uint64_t>(payload.size()) >> (i * 8)) & 0xFF));
    }
  }

  if(!masked) {
    frame.append(payload);
    return frame;
  }
  auto key = random_bytes(4);
  frame.append(reinterpret_cast<const char*>(key.data()), key.size());
  for(std::size_t i = 0; i < payload.size(); ++i) {
    frame.push_back(static_cast<char>(payload[i] ^ static_cast<char>(key[i % 4])));
  }
  return frame;
}

std::string encode_close_frame(std::uint16_t code, const std::string& reason, bool masked) {
  std::string payload;
  payload.push_back(static_cast<char>((code >> 8) & 0xFF));
  payload.push_back(static_cast<char>(code & 0xFF));
  payload.append(reason.substr(0, 123));
  return encode_frame(WsOpcode::Close, payload, masked);
}

WsFrameDecoder::WsFrameDecoder(bool require_masked, std::size_t max_message)
  : require_masked_(require_masked), max_message_(max_message) {}

void WsFrameDecoder::append(const char* data, std::size_t size) {
  buffer_.append(data, size);
}

std::optional<WsFrame> WsFrameDecoder::next() {
  while(true) {
    if(buffer_.size() < 2) return std::nullopt;
    const auto b0 = static_cast<std::uint8_t>(buffer_[0]);
    const auto b1 = static_cast<std::uint8_t>(buffer_[1]);
    const bool fin = (b0 & 0x80) != 0;
    if(b0 & 0x70) {
      throw ValidationError("websocket frame uses reserved bits");
    }
    const auto opcode = static_cast<WsOpcode>(b0 & 0x0F);
    const bool masked = (b1 & 0x80) != 0;
    if(require_masked_ && !masked) {
      throw ValidationError("client websocket frames must be masked");
    }

    std::size_t offset = 2;
    std::uint64_t length = b1 & 0x7F;
    if(length == 126) {
      if(buffer_.size() < offset + 2) return std::nullopt;
      length = (static_cast<std::uint64_t>(static_cast<std::uint8_t>(buffer_[2])) << 8) |
               static_cast<std::uint8_t>(buffer_[3]);
      offset += 2;
    } else if(length == 127) {
      if(buffer_.size() < offset + 8) return std::nullopt;
      length = 0;
      for(int i = 0; i < 8; ++i) {
        length = (length << 8) | static_cast<std::uint8_t>(buffer_[2 + i]);
      }
      offset += 8;
    }

    if(is_control(opcode) && (length > 125 || !fin)) {
      throw ValidationError("invalid websocket control frame");
    }
    if(length > max_message_ || partial_.size() + length > max_message_) {
      throw ValidationError("websocket message too large");
    }

    std::uint8_t key[4] = {0, 0, 0, 0};
    if(masked) {
      if(buffer_.size() < offset + 4) return std::nullopt;
      std::memcpy(key, buffer_.data() + offset, 4);
      offset += 4;
    }
    if(buffer_.size() < offset + length) return std::nullopt;

    std::string payload = buffer_.substr(offset, static_cast<std::size_t>(length));
    if(masked) {
      for(std::size_t i = 0; i < payload.size(); ++i) {
        payload[i] = static_cast<char>(payload[i] ^ static_cast<char>(key[i % 4]));
      }
    }
    buffer_.erase(0, offset + static_cast<std::size_t>(length));

    if(is_control(opcode)) {
      return WsFrame{opcode, std::move(payload)};
    }

    if(opcode == WsOpcode::Continuation) {
      if(!partial_opcode_) {
        throw ValidationError("unexpected websocket continuation frame");
      }
      partial_ += payload;
    } else {
      if(partial_opcode_) {
        throw ValidationError("websocket message interleaved with another");
      }
      if(opcode != WsOpcode::Text && opcode != WsOpcode::Binary) {
        throw ValidationError("unknown websocket opcode");
      }
      partial_opcode_ = opcode;
      partial_ = std::move(payload);
    }

    if(fin) {
      WsFrame frame{*partial_opcode_, std::move(partial_)};
      partial_opcode_.reset();
      partial_.clear();
      return frame;
    }
  }
}
