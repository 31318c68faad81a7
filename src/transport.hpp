#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "bridge_config.hpp"
#include "http_message.hpp"

// Bridge-side networking: the server URL, a stream that is either plain TCP
// or TLS over TCP, and a blocking HTTP client built on it.

struct ServerUrl {
  std::string scheme;  // "http" | "https"
  std::string host;
  std::string port;
  std::string base_path;  // without trailing '/'

  bool tls() const { return scheme == "https"; }
  std::string host_header() const;
  // base_path + path
  std::string target(const std::string& path) const;
};

// Throws ConfigError on anything but an absolute http(s) URL.
ServerUrl parse_server_url(const std::string& url);

// Throws ConfigError when the URL is plain http and insecure transport was
// not allowed.
void ensure_transport_allowed(const ServerUrl& url, bool allow_insecure);

std::shared_ptr<asio::ssl::context> make_tls_context();

// Sets x-api-key or Authorization: Bearer from the identity, api key first.
void apply_credentials(HttpRequest& request, const BridgeIdentity& identity);

class ClientStream {
public:
  // tls may be null for plain http.
  ClientStream(asio::io_context& io, const ServerUrl& url, std::shared_ptr<asio::ssl::context> tls);

  asio::ip::tcp::socket& socket();

  template<typename Handler>
  void async_connect(const asio::ip::tcp::resolver::results_type& endpoints, Handler&& handler) {
    asio::async_connect(socket(), endpoints, std::forward<Handler>(handler));
  }

  // TLS handshake with SNI and host name verification; completes
  // immediately for plain streams.
  void async_handshake(std::function<void(const std::error_code&)> handler);

  template<typename ConstBuffers, typename Handler>
  void async_write(const ConstBuffers& buffers, Handler&& handler) {
    if(tls_) {
      asio::async_write(*tls_, buffers, std::forward<Handler>(handler));
    } else {
      asio::async_write(*plain_, buffers, std::forward<Handler>(handler));
    }
  }

  template<typename MutableBuffers, typename Handler>
  void async_read_some(const MutableBuffers& buffers, Handler&& handler) {
    if(tls_) {
      tls_->async_read_some(buffers, std::forward<Handler>(handler));
    } else {
      plain_->async_read_some(buffers, std::forward<Handler>(handler));
    }
  }

  template<typename Handler>
  void async_read_until(asio::streambuf& buffer, const std::string& delimiter, Handler&& handler) {
    if(tls_) {
      asio::async_read_until(*tls_, buffer, delimiter, std::forward<Handler>(handler));
    } else {
      asio::async_read_until(*plain_, buffer, delimiter, std::forward<Handler>(handler));
    }
  }

  template<typename Handler>
  void async_read_exactly(asio::streambuf& buffer, std::size_t bytes, Handler&& handler) {
    if(tls_) {
      asio::async_read(*tls_, buffer, asio::transfer_exactly(bytes), std::forward<Handler>(handler));
    } else {
      asio::async_read(*plain_, buffer, asio::transfer_exactly(bytes), std::forward<Handler>(handler));
    }
  }

  void close();

private:
  std::string host_;
  std::unique_ptr<asio::ip::tcp::socket> plain_;
  std::unique_ptr<asio::ssl::stream<asio::ip::tcp::socket>> tls_;
};

// One request per connection, each step bounded by the timeout. Transport
// failures throw TransportError; any HTTP status is returned as-is.
class HttpClient {
public:
  HttpClient(ServerUrl url,
             std::shared_ptr<asio::ssl::context> tls,
             std::chrono::milliseconds timeout = std::chrono::seconds(15));

  HttpResponse send(HttpRequest request);
  HttpResponse post_json(const std::string& path,
                         const nlohmann::json& body,
                         const BridgeIdentity* identity = nullptr);

  const ServerUrl& url() const { return url_; }

private:
  ServerUrl url_;
  std::shared_ptr<asio::ssl::context> tls_;
  std::chrono::milliseconds timeout_;
};
