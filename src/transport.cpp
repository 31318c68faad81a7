#include "transport.hpp"

#include <array>
#include <iterator>

#include <openssl/err.h>

#include "protocol.hpp"
#include "utils.hpp"

using asio::ip::tcp;

std::string ServerUrl::host_header() const {
  std::string host_part = host.find(':') != std::string::npos ? "[" + host + "]" : host;
  bool default_port = (tls() && port == "443") || (!tls() && port == "80");
  return default_port ? host_part : host_part + ":" + port;
}

std::string ServerUrl::target(const std::string& path) const {
  return base_path + path;
}

ServerUrl parse_server_url(const std::string& url) {
  ServerUrl out;
  auto trimmed = trim_copy(url);
  auto scheme_end = trimmed.find("://");
  if(scheme_end == std::string::npos) {
    throw ConfigError("invalid server url: " + url);
  }
  out.scheme = to_lower(trimmed.substr(0, scheme_end));
  if(out.scheme != "http" && out.scheme != "https") {
    throw ConfigError("unsupported url scheme: " + out.scheme);
  }
  auto rest = trimmed.substr(scheme_end + 3);
  auto slash = rest.find('/');
  auto authority = rest.substr(0, slash);
  out.base_path = slash == std::string::npos ? std::string() : rest.substr(slash);
  while(!out.base_path.empty() && out.base_path.back() == '/') out.base_path.pop_back();

  if(auto at = authority.rfind('@'); at != std::string::npos) {
    authority = authority.substr(at + 1);
  }
  if(!authority.empty() && authority.front() == '[') {
    auto close = authority.find(']');
    if(close == std::string::npos) throw ConfigError("invalid server url: " + url);
    out.host = authority.substr(1, close - 1);
    if(close + 1 < authority.size() && authority[close + 1] == ':') {
      out.port = authority.substr(close + 2);
    }
  } else {
    auto colon = authority.rfind(':');
    out.host = authority.substr(0, colon);
    if(colon != std::string::npos) out.port = authority.substr(colon + 1);
  }
  if(out.host.empty()) {
    throw ConfigError("invalid server url: " + url);
  }
  if(out.port.empty()) {
    out.port = out.tls() ? "443" : "80";
  }
  return out;
}

void ensure_transport_allowed(const ServerUrl& url, bool allow_insecure) {
  if(!url.tls() && !allow_insecure) {
    throw ConfigError("TLS required. Use --allow-insecure for http.");
  }
}

std::shared_ptr<asio::ssl::context> make_tls_context() {
  auto context = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
  context->set_default_verify_paths();
  context->set_verify_mode(asio::ssl::verify_peer);
  return context;
}

void apply_credentials(HttpRequest& request, const BridgeIdentity& identity) {
  if(auto key = identity.api_key(); key && !key->empty()) {
    request.set_header("x-api-key", *key);
  } else if(auto token = identity.access_token(); token && !token->empty()) {
    request.set_header("authorization", "Bearer " + *token);
  }
}

ClientStream::ClientStream(asio::io_context& io, const ServerUrl& url, std::shared_ptr<asio::ssl::context> tls)
  : host_(url.host) {
  if(tls) {
    tls_ = std::make_unique<asio::ssl::stream<tcp::socket>>(io, *tls);
  } else {
    plain_ = std::make_unique<tcp::socket>(io);
  }
}

tcp::socket& ClientStream::socket() {
  return tls_ ? tls_->next_layer() : *plain_;
}

void ClientStream::async_handshake(std::function<void(const std::error_code&)> handler) {
  if(!tls_) {
    asio::post(socket().get_executor(), [handler = std::move(handler)]{ handler(std::error_code()); });
    return;
  }
  if(!SSL_set_tlsext_host_name(tls_->native_handle(), host_.c_str())) {
    std::error_code ec(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category());
    asio::post(socket().get_executor(), [handler = std::move(handler), ec]{ handler(ec); });
    return;
  }
  tls_->set_verify_callback(asio::ssl::host_name_verification(host_));
  tls_->async_handshake(asio::ssl::stream_base::client, std::move(handler));
}

void ClientStream::close() {
  std::error_code ec;
  socket().shutdown(tcp::socket::shutdown_both, ec);
  socket().close(ec);
}

HttpClient::HttpClient(ServerUrl url, std::shared_ptr<asio::ssl::context> tls, std::chrono::milliseconds timeout)
  : url_(std::move(url)), tls_(std::move(tls)), timeout_(timeout) {
  if(url_.tls() && !tls_) {
    tls_ = make_tls_context();
  }
}

HttpResponse HttpClient::send(HttpRequest request) {
  asio::io_context io;
  ClientStream stream(io, url_, url_.tls() ? tls_ : nullptr);
  auto deadline = std::chrono::steady_clock::now() + timeout_;

  std::error_code result;
  bool done = false;
  auto run = [&](const char* step) {
    io.restart();
    io.run_until(deadline);
    if(!done) {
      stream.close();
      throw TransportError(std::string(step) + " timed out (" + url_.host_header() + ")");
    }
    if(result) {
      throw TransportError(std::string(step) + " failed (" + url_.host_header() + "): " + result.message());
    }
    done = false;
  };

  tcp::resolver resolver(io);
  tcp::resolver::results_type endpoints;
  resolver.async_resolve(url_.host, url_.port,
    [&](const std::error_code& ec, tcp::resolver::results_type results) {
      result = ec;
      endpoints = std::move(results);
      done = true;
    });
  run("resolve");

  stream.async_connect(endpoints, [&](const std::error_code& ec, const tcp::endpoint&) {
    result = ec;
    done = true;
  });
  run("connect");

  stream.async_handshake([&](const std::error_code& ec) {
    result = ec;
    done = true;
  });
  run("handshake");

  request.set_header("host", url_.host_header());
  request.set_header("connection", "close");
  auto wire = serialize(request);
  stream.async_write(asio::buffer(wire), [&](const std::error_code& ec, std::size_t) {
    result = ec;
    done = true;
  });
  run("write");

  asio::streambuf buffer(kMaxHeaderBytes + kMaxBodyBytes);
  std::size_t head_size = 0;
  stream.async_read_until(buffer, "\r\n\r\n", [&](const std::error_code& ec, std::size_t n) {
    result = ec;
    head_size = n;
    done = true;
  });
  run("read");

  std::string data(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
  buffer.consume(buffer.size());
  auto response = parse_response_head(data.substr(0, head_size));
  std::string body = data.substr(head_size);

  if(response.header("content-length")) {
    auto length = content_length(response.headers);
    if(body.size() < length) {
      stream.async_read_exactly(buffer, length - body.size(), [&](const std::error_code& ec, std::size_t) {
        result = ec;
        done = true;
      });
      run("read body");
      body.append(asio::buffers_begin(buffer.data()), asio::buffers_end(buffer.data()));
    }
    body.resize(length);
  } else if(response.status != 204 && response.status != 304) {
    std::array<char, 8192> chunk{};
    for(;;) {
      std::size_t got = 0;
      stream.async_read_some(asio::buffer(chunk), [&](const std::error_code& ec, std::size_t n) {
        result = ec;
        got = n;
        done = true;
      });
      io.restart();
      io.run_until(deadline);
      if(!done) {
        stream.close();
        throw TransportError("read body timed out (" + url_.host_header() + ")");
      }
      done = false;
      body.append(chunk.data(), got);
      if(result == asio::error::eof || result == asio::ssl::error::stream_truncated) break;
      if(result) {
        throw TransportError("read body failed (" + url_.host_header() + "): " + result.message());
      }
      if(body.size() > kMaxBodyBytes) {
        throw TransportError("response body too large");
      }
    }
  }
  response.body = std::move(body);
  stream.close();
  return response;
}

HttpResponse HttpClient::post_json(const std::string& path,
                                   const nlohmann::json& body,
                                   const BridgeIdentity* identity) {
  HttpRequest request;
  request.method = "POST";
  request.target = url_.target(path);
  request.set_header("content-type", "application/json");
  request.set_header("accept", "application/json");
  request.body = dump_json(body);
  if(identity) {
    apply_credentials(request, *identity);
  }
  return send(std::move(request));
}
