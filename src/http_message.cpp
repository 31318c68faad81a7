#include "http_message.hpp"

#include <sstream>
#include <stdexcept>

#include "sync_error.hpp"
#include "utils.hpp"

namespace {

// Splits "Name: value" lines after the start line into headers.
void parse_header_lines(std::istringstream& in, HttpHeaders& headers) {
  std::string line;
  while(std::getline(in, line)) {
    if(!line.empty() && line.back() == '\r') line.pop_back();
    if(line.empty()) break;
    auto colon = line.find(':');
    if(colon == std::string::npos || colon == 0) {
      throw ValidationError("malformed header line");
    }
    auto name = to_lower(trim_copy(line.substr(0, colon)));
    auto value = trim_copy(line.substr(colon + 1));
    auto existing = headers.find(name);
    if(existing != headers.end()) {
      existing->second += ", " + value;
    } else {
      headers.emplace(std::move(name), std::move(value));
    }
  }
}

std::string first_line(std::istringstream& in) {
  std::string line;
  if(!std::getline(in, line)) {
    throw ValidationError("empty HTTP message");
  }
  if(!line.empty() && line.back() == '\r') line.pop_back();
  return line;
}

void write_headers(std::ostringstream& out, const HttpHeaders& headers, std::size_t body_size) {
  bool has_length = false;
  for(const auto& [name, value] : headers) {
    if(name == "content-length") has_length = true;
    out << name << ": " << value << "\r\n";
  }
  if(!has_length && body_size > 0) {
    out << "content-length: " << body_size << "\r\n";
  }
  out << "\r\n";
}

} // namespace

std::string HttpRequest::path() const {
  auto q = target.find('?');
  return q == std::string::npos ? target : target.substr(0, q);
}

std::string HttpRequest::query() const {
  auto q = target.find('?');
  return q == std::string::npos ? std::string() : target.substr(q + 1);
}

std::optional<std::string> HttpRequest::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  if(it == headers.end()) return std::nullopt;
  return it->second;
}

void HttpRequest::set_header(const std::string& name, std::string value) {
  headers[to_lower(name)] = std::move(value);
}

std::optional<std::string> HttpResponse::header(const std::string& name) const {
  auto it = headers.find(to_lower(name));
  if(it == headers.end()) return std::nullopt;
  return it->second;
}

void HttpResponse::set_header(const std::string& name, std::string value) {
  headers[to_lower(name)] = std::move(value);
}

const char* reason_phrase(int status) {
  switch(status) {
    case 101: return "Switching Protocols";
    case 200: return "OK";
    case 201: return "Created";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 413: return "Payload Too Large";
    case 426: return "Upgrade Required";
    case 500: return "Internal Server Error";
    case 502: return "Bad Gateway";
    default: return "Unknown";
  }
}

HttpRequest parse_request_head(const std::string& head) {
  if(head.size() > kMaxHeaderBytes) {
    throw ValidationError("request header too large");
  }
  std::istringstream in(head);
  HttpRequest request;
  std::istringstream start(first_line(in));
  if(!(start >> request.method >> request.target >> request.version)) {
    throw ValidationError("malformed request line");
  }
  if(request.version.rfind("HTTP/1.", 0) != 0) {
    throw ValidationError("unsupported HTTP version " + request.version);
  }
  if(request.target.empty() || request.target.front() != '/') {
    throw ValidationError("request target must be an absolute path");
  }
  parse_header_lines(in, request.headers);
  return request;
}

HttpResponse parse_response_head(const std::string& head) {
  if(head.size() > kMaxHeaderBytes) {
    throw ValidationError("response header too large");
  }
  std::istringstream in(head);
  auto line = first_line(in);
  HttpResponse response;
  auto sp1 = line.find(' ');
  if(sp1 == std::string::npos || line.rfind("HTTP/1.", 0) != 0) {
    throw ValidationError("malformed status line");
  }
  response.version = line.substr(0, sp1);
  auto sp2 = line.find(' ', sp1 + 1);
  auto code = line.substr(sp1 + 1, sp2 == std::string::npos ? std::string::npos : sp2 - sp1 - 1);
  try {
    std::size_t consumed = 0;
    response.status = std::stoi(code, &consumed);
    if(consumed != code.size()) throw std::invalid_argument(code);
  } catch(const std::exception&) {
    throw ValidationError("malformed status code '" + code + "'");
  }
  response.reason = sp2 == std::string::npos ? std::string() : line.substr(sp2 + 1);
  parse_header_lines(in, response.headers);
  return response;
}

std::size_t content_length(const HttpHeaders& headers) {
  auto it = headers.find("content-length");
  if(it == headers.end()) return 0;
  const auto& text = it->second;
  if(text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw ValidationError("malformed content-length");
  }
  unsigned long long value = 0;
  try {
    value = std::stoull(text);
  } catch(const std::exception&) {
    throw ValidationError("malformed content-length");
  }
  if(value > kMaxBodyBytes) {
    throw ValidationError("body exceeds " + std::to_string(kMaxBodyBytes) + " bytes");
  }
  return static_cast<std::size_t>(value);
}

std::string serialize(const HttpRequest& request) {
  std::ostringstream out;
  out << request.method << ' ' << request.target << ' ' << request.version << "\r\n";
  write_headers(out, request.headers, request.body.size());
  out << request.body;
  return out.str();
}

std::string serialize(const HttpResponse& response) {
  std::ostringstream out;
  out << response.version << ' ' << response.status << ' '
      << (response.reason.empty() ? reason_phrase(response.status) : response.reason.c_str())
      << "\r\n";
  auto headers = response.headers;
  if(response.status != 101 && response.status != 204 && !headers.count("content-length")) {
    headers["content-length"] = std::to_string(response.body.size());
  }
  write_headers(out, headers, response.body.size());
  out << response.body;
  return out.str();
}

HttpResponse make_json_response(int status, const std::string& body) {
  HttpResponse response;
  response.status = status;
  response.set_header("content-type", "application/json");
  response.body = body;
  return response;
}
