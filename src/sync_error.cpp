#include "sync_error.hpp"

const char* error_kind_name(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Auth: return "unauthorized";
    case ErrorKind::Forbidden: return "forbidden";
    case ErrorKind::NotFound: return "not_found";
    case ErrorKind::Conflict: return "conflict";
    case ErrorKind::Transport: return "transport_error";
    case ErrorKind::Validation: return "invalid_request";
    case ErrorKind::Internal: return "internal_error";
  }
  return "internal_error";
}

int http_status_for(ErrorKind kind) {
  switch(kind) {
    case ErrorKind::Auth: return 401;
    case ErrorKind::Forbidden: return 403;
    case ErrorKind::NotFound: return 404;
    case ErrorKind::Conflict: return 409;
    case ErrorKind::Transport: return 502;
    case ErrorKind::Validation: return 400;
    case ErrorKind::Internal: return 500;
  }
  return 500;
}
