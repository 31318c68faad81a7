#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>

// Minimal HTTP/1.1 message model shared by the server sessions and the
// bridge's client. Header names are stored lower-cased.

inline constexpr std::size_t kMaxHeaderBytes = 16 * 1024;
inline constexpr std::size_t kMaxBodyBytes = 32 * 1024 * 1024;

using HttpHeaders = std::map<std::string, std::string>;

struct HttpRequest {
  std::string method;
  std::string target;  // as sent, path plus optional query
  std::string version = "HTTP/1.1";
  HttpHeaders headers;
  std::string body;

  std::string path() const;
  std::string query() const;
  std::optional<std::string> header(const std::string& name) const;
  void set_header(const std::string& name, std::string value);
};

struct HttpResponse {
  int status = 200;
  std::string reason;
  std::string version = "HTTP/1.1";
  HttpHeaders headers;
  std::string body;

  std::optional<std::string> header(const std::string& name) const;
  void set_header(const std::string& name, std::string value);
};

const char* reason_phrase(int status);

// Parse everything up to and including the blank line. Throws ValidationError.
HttpRequest parse_request_head(const std::string& head);
HttpResponse parse_response_head(const std::string& head);

// Declared Content-Length, 0 when absent. Throws ValidationError when the
// value is malformed or over kMaxBodyBytes.
std::size_t content_length(const HttpHeaders& headers);

std::string serialize(const HttpRequest& request);
std::string serialize(const HttpResponse& response);

HttpResponse make_json_response(int status, const std::string& body);
