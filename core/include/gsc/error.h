#pragma once

#include <string>

namespace gsc {

enum class ErrorKind {
  None,
  Transport,
  Auth,
  Protocol,
  BridgeTimeout,
  BridgeStale,
  BridgeStopped,
  CommandFailed,
  NotConfigured,
  ServerStarting,
  Cancelled,
  Io,
};

struct Error {
  ErrorKind kind = ErrorKind::None;
  std::string message;
  // errno-style detail for transport failures (ECONNREFUSED, ETIMEDOUT, ...); 0 when unknown.
  int code = 0;

  bool empty() const { return kind == ErrorKind::None; }
};

Error make_error(ErrorKind kind, std::string message, int code = 0);
Error transport_error(int code, const std::string& context);

const char* error_kind_name(ErrorKind kind);

// Refused/reset/timeout style failures that warrant a reconnect.
bool is_transport_failure(const Error& error);
bool is_retryable(const Error& error);

// Short message safe to show to an operator.
std::string user_message(const Error& error);

} // namespace gsc
