#pragma once

#include <stdexcept>
#include <string>
#include <utility>

enum class ErrorKind {
  Auth,
  Forbidden,
  NotFound,
  Conflict,
  Transport,
  Validation,
  Internal
};

const char* error_kind_name(ErrorKind kind);
int http_status_for(ErrorKind kind);

class SyncError : public std::runtime_error {
public:
  SyncError(ErrorKind kind, const std::string& message, std::string code = {})
    : std::runtime_error(message), kind_(kind), code_(std::move(code)) {}

  ErrorKind kind() const { return kind_; }
  int http_status() const { return http_status_for(kind_); }
  // Machine-readable code for the error body; defaults to the kind's name.
  std::string code() const { return code_.empty() ? error_kind_name(kind_) : code_; }

private:
  ErrorKind kind_;
  std::string code_;
};

struct AuthError : SyncError {
  explicit AuthError(const std::string& message) : SyncError(ErrorKind::Auth, message) {}
};

// Authenticated caller, but the machine it speaks for has been revoked.
struct RevokedError : SyncError {
  explicit RevokedError(const std::string& message) : SyncError(ErrorKind::Forbidden, message) {}
};

struct NotFoundError : SyncError {
  explicit NotFoundError(const std::string& message) : SyncError(ErrorKind::NotFound, message) {}
};

struct ValidationError : SyncError {
  explicit ValidationError(const std::string& message, std::string code = {})
    : SyncError(ErrorKind::Validation, message, std::move(code)) {}
};

struct TransportError : SyncError {
  explicit TransportError(const std::string& message) : SyncError(ErrorKind::Transport, message) {}
};
