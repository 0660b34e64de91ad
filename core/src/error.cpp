#include "gsc/error.h"

#include <cerrno>
#include <cstring>

namespace gsc {

Error make_error(ErrorKind kind, std::string message, int code) {
  Error error;
  error.kind = kind;
  error.message = std::move(message);
  error.code = code;
  return error;
}

Error transport_error(int code, const std::string& context) {
  std::string message = context;
  if (code != 0) {
    message += ": ";
    message += std::strerror(code);
  }
  return make_error(ErrorKind::Transport, message, code);
}

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None: return "none";
    case ErrorKind::Transport: return "transport";
    case ErrorKind::Auth: return "auth";
    case ErrorKind::Protocol: return "protocol";
    case ErrorKind::BridgeTimeout: return "bridge_timeout";
    case ErrorKind::BridgeStale: return "bridge_stale";
    case ErrorKind::BridgeStopped: return "bridge_stopped";
    case ErrorKind::CommandFailed: return "command_failed";
    case ErrorKind::NotConfigured: return "not_configured";
    case ErrorKind::ServerStarting: return "server_starting";
    case ErrorKind::Cancelled: return "cancelled";
    case ErrorKind::Io: return "io";
  }
  return "unknown";
}

bool is_transport_failure(const Error& error) {
  return error.kind == ErrorKind::Transport;
}

bool is_retryable(const Error& error) {
  if (error.kind != ErrorKind::Transport) {
    return false;
  }
  switch (error.code) {
    case ECONNREFUSED:
    case ETIMEDOUT:
    case ECONNRESET:
    case EPIPE:
    case ENOTCONN:
    case EHOSTUNREACH:
    case ENETUNREACH:
    case 0:
      return true;
    default:
      return false;
  }
}

std::string user_message(const Error& error) {
  switch (error.kind) {
    case ErrorKind::None:
      return "";
    case ErrorKind::Transport:
      switch (error.code) {
        case ECONNREFUSED:
          return "Cannot connect to server. Is the game server running with RCON enabled?";
        case ETIMEDOUT:
          return "Connection timed out. Server may be unresponsive or firewall is blocking.";
        case ECONNRESET:
        case EPIPE:
          return "Connection was reset. Server may have restarted or crashed.";
        case ENOTCONN:
          return "Not connected to server. Please check if server is running.";
        default:
          break;
      }
      return error.message.empty() ? "Unknown error occurred" : error.message;
    case ErrorKind::Auth:
      return "Authentication failed. Check RCON password in server settings.";
    case ErrorKind::ServerStarting:
      return "Server is starting, please wait...";
    default:
      break;
  }
  return error.message.empty() ? "Unknown error occurred" : error.message;
}

} // namespace gsc
