#include "gsc_rcon/connection.h"

#include "gsc/log.h"

#include <cerrno>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace gsc::rcon {

namespace {
constexpr size_t kReadChunk = 8192;

int open_nonblocking_socket(const Endpoint& endpoint, Error& error) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* result = nullptr;
  const std::string port = std::to_string(endpoint.port);
  const int rc = ::getaddrinfo(endpoint.host.c_str(), port.c_str(), &hints, &result);
  if (rc != 0 || result == nullptr) {
    error = make_error(ErrorKind::Transport,
                       "cannot resolve " + endpoint.host + ": " + ::gai_strerror(rc), EHOSTUNREACH);
    return -1;
  }

  int fd = -1;
  int last_errno = ECONNREFUSED;
  for (addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      last_errno = errno;
      continue;
    }
    const int one = 1;
    ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0 || errno == EINPROGRESS) {
      break;
    }
    last_errno = errno;
    ::close(fd);
    fd = -1;
  }
  ::freeaddrinfo(result);

  if (fd < 0) {
    error = transport_error(last_errno, "connect to " + endpoint.host + ":" + port);
  }
  return fd;
}
} // namespace

TcpRconConnection::TcpRconConnection(EventLoop& loop, std::chrono::milliseconds multi_packet_quiet)
    : loop_(loop), quiet_(multi_packet_quiet) {}

TcpRconConnection::~TcpRconConnection() {
  close();
}

Future<Unit> TcpRconConnection::open(const Endpoint& endpoint) {
  if (state_ != State::Idle) {
    return make_failed_future<Unit>(make_error(ErrorKind::Protocol, "connection already used"));
  }
  open_promise_ = Promise<Unit>();
  password_ = endpoint.password;

  Error error;
  fd_ = open_nonblocking_socket(endpoint, error);
  if (fd_ < 0) {
    state_ = State::Closed;
    open_promise_.reject(error);
    return open_promise_.future();
  }

  state_ = State::Connecting;
  loop_.watch_fd(fd_, EventLoop::kWritable, [this](uint32_t events) { on_io(events); });
  return open_promise_.future();
}

Future<std::string> TcpRconConnection::execute(const std::string& command) {
  if (state_ != State::Open) {
    return make_failed_future<std::string>(transport_error(ENOTCONN, "rcon not connected"));
  }
  Packet packet;
  packet.id = next_id_++;
  packet.type = kTypeExecCommand;
  packet.body = command;
  std::string error;
  if (!queue_packet(packet, error)) {
    return make_failed_future<std::string>(make_error(ErrorKind::Protocol, error));
  }
  PendingCommand pending;
  auto future = pending.promise.future();
  pending_.emplace(packet.id, std::move(pending));
  flush_output();
  return future;
}

void TcpRconConnection::close() {
  if (state_ == State::Closed || state_ == State::Idle) {
    state_ = State::Closed;
    return;
  }
  teardown(transport_error(ECONNRESET, "rcon connection closed"));
}

void TcpRconConnection::on_io(uint32_t events) {
  if (state_ == State::Connecting) {
    if (events & (EventLoop::kWritable | EventLoop::kError)) {
      on_connected();
    }
    return;
  }
  if (events & EventLoop::kReadable) {
    on_readable();
  }
  if (state_ == State::Closed) {
    return;
  }
  if (events & EventLoop::kWritable) {
    flush_output();
  }
  if (state_ != State::Closed && (events & EventLoop::kError) && !(events & EventLoop::kReadable)) {
    fail(transport_error(ECONNRESET, "rcon socket error"));
  }
}

void TcpRconConnection::on_connected() {
  int so_error = 0;
  socklen_t len = sizeof(so_error);
  if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0) {
    so_error = errno;
  }
  if (so_error != 0) {
    fail(transport_error(so_error, "rcon connect"));
    return;
  }

  state_ = State::Authenticating;
  Packet auth;
  auth.id = auth_id_;
  auth.type = kTypeAuth;
  auth.body = password_;
  std::string error;
  if (!queue_packet(auth, error)) {
    fail(make_error(ErrorKind::Auth, error));
    return;
  }
  flush_output();
}

void TcpRconConnection::on_readable() {
  char chunk[kReadChunk];
  while (state_ != State::Closed) {
    const ssize_t n = ::recv(fd_, chunk, sizeof(chunk), 0);
    if (n > 0) {
      in_buffer_.append(chunk, static_cast<size_t>(n));
      continue;
    }
    if (n == 0) {
      fail(transport_error(ECONNRESET, "rcon connection closed by server"));
      return;
    }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) break;
    fail(transport_error(errno, "rcon read"));
    return;
  }

  while (state_ != State::Closed) {
    Packet packet;
    size_t consumed = 0;
    std::string error;
    const DecodeStatus status = decode_packet(in_buffer_, packet, consumed, error);
    if (status == DecodeStatus::NeedMore) {
      break;
    }
    if (status == DecodeStatus::Malformed) {
      fail(make_error(ErrorKind::Protocol, error));
      return;
    }
    in_buffer_.erase(0, consumed);
    handle_packet(packet);
  }
}

void TcpRconConnection::handle_packet(const Packet& packet) {
  if (state_ == State::Authenticating) {
    // The server mirrors an empty RESPONSE_VALUE before the auth verdict.
    if (packet.type != kTypeAuthResponse) {
      return;
    }
    if (packet.id == kAuthDeniedId) {
      fail(make_error(ErrorKind::Auth, "Authentication failed"));
      return;
    }
    if (packet.id != auth_id_) {
      fail(make_error(ErrorKind::Protocol,
                      "unexpected auth response id " + std::to_string(packet.id)));
      return;
    }
    state_ = State::Open;
    update_interest();
    open_promise_.resolve(Unit{});
    return;
  }

  if (state_ != State::Open || packet.type != kTypeResponseValue) {
    return;
  }
  auto it = pending_.find(packet.id);
  if (it == pending_.end()) {
    log::debug("rcon: dropping response for unknown id " + std::to_string(packet.id));
    return;
  }
  it->second.body += packet.body;
  if (it->second.quiet_timer != kInvalidTimer) {
    loop_.cancel(it->second.quiet_timer);
    it->second.quiet_timer = kInvalidTimer;
  }
  if (!body_may_continue(packet)) {
    finish_command(packet.id);
    return;
  }
  const int32_t id = packet.id;
  it->second.quiet_timer = loop_.call_later(quiet_, [this, id] { finish_command(id); });
}

void TcpRconConnection::finish_command(int32_t id) {
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return;
  }
  PendingCommand done = std::move(it->second);
  pending_.erase(it);
  if (done.quiet_timer != kInvalidTimer) {
    loop_.cancel(done.quiet_timer);
  }
  done.promise.resolve(std::move(done.body));
}

bool TcpRconConnection::queue_packet(const Packet& packet, std::string& error) {
  return encode_packet(packet, out_buffer_, error);
}

void TcpRconConnection::flush_output() {
  while (!out_buffer_.empty() && fd_ >= 0) {
    const ssize_t n = ::send(fd_, out_buffer_.data(), out_buffer_.size(), MSG_NOSIGNAL);
    if (n > 0) {
      out_buffer_.erase(0, static_cast<size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
    fail(transport_error(n < 0 ? errno : EPIPE, "rcon write"));
    return;
  }
  update_interest();
}

void TcpRconConnection::update_interest() {
  if (fd_ < 0 || state_ == State::Connecting) {
    return;
  }
  uint32_t events = EventLoop::kReadable;
  if (!out_buffer_.empty()) {
    events |= EventLoop::kWritable;
  }
  loop_.update_fd(fd_, events);
}

void TcpRconConnection::fail(const Error& error) {
  if (state_ == State::Closed) {
    return;
  }
  const bool was_open = state_ == State::Open;
  teardown(error);
  if (was_open && close_handler_) {
    const CloseHandler handler = close_handler_;
    handler(error);
  }
}

void TcpRconConnection::teardown(const Error& error) {
  state_ = State::Closed;
  if (fd_ >= 0) {
    loop_.unwatch_fd(fd_);
    ::close(fd_);
    fd_ = -1;
  }
  in_buffer_.clear();
  out_buffer_.clear();

  auto pending = std::move(pending_);
  pending_.clear();
  for (auto& entry : pending) {
    if (entry.second.quiet_timer != kInvalidTimer) {
      loop_.cancel(entry.second.quiet_timer);
    }
  }
  open_promise_.reject(error);
  for (auto& entry : pending) {
    entry.second.promise.reject(error);
  }
}

} // namespace gsc::rcon
