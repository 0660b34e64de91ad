#pragma once

#include "gsc/event_loop.h"
#include "gsc/future.h"
#include "gsc_rcon/packet.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>

namespace gsc::rcon {

struct Endpoint {
  std::string host = "127.0.0.1";
  uint16_t port = 27015;
  std::string password;
};

// One authenticated RCON channel. Implementations settle every outstanding
// future when closed, so no caller waits on a dead socket.
class RconConnection {
 public:
  using CloseHandler = std::function<void(const Error&)>;

  virtual ~RconConnection() = default;

  // TCP connect followed by the auth exchange.
  virtual Future<Unit> open(const Endpoint& endpoint) = 0;
  virtual Future<std::string> execute(const std::string& command) = 0;
  // Local close; the close handler is not invoked.
  virtual void close() = 0;
  virtual bool is_open() const = 0;
  // Invoked once when the peer drops the connection or I/O fails.
  virtual void set_close_handler(CloseHandler handler) = 0;
};

using ConnectionFactory = std::function<std::shared_ptr<RconConnection>()>;

class TcpRconConnection final : public RconConnection {
 public:
  TcpRconConnection(EventLoop& loop, std::chrono::milliseconds multi_packet_quiet);
  ~TcpRconConnection() override;

  TcpRconConnection(const TcpRconConnection&) = delete;
  TcpRconConnection& operator=(const TcpRconConnection&) = delete;

  Future<Unit> open(const Endpoint& endpoint) override;
  Future<std::string> execute(const std::string& command) override;
  void close() override;
  bool is_open() const override { return state_ == State::Open; }
  void set_close_handler(CloseHandler handler) override { close_handler_ = std::move(handler); }

 private:
  enum class State { Idle, Connecting, Authenticating, Open, Closed };

  struct PendingCommand {
    Promise<std::string> promise;
    std::string body;
    TimerId quiet_timer = kInvalidTimer;
  };

  void on_io(uint32_t events);
  void on_connected();
  void on_readable();
  void flush_output();
  void handle_packet(const Packet& packet);
  void finish_command(int32_t id);
  bool queue_packet(const Packet& packet, std::string& error);
  void update_interest();
  void fail(const Error& error);
  void teardown(const Error& error);

  EventLoop& loop_;
  std::chrono::milliseconds quiet_;
  State state_ = State::Idle;
  int fd_ = -1;
  std::string password_;
  std::string in_buffer_;
  std::string out_buffer_;
  Promise<Unit> open_promise_;
  int32_t auth_id_ = 10;
  int32_t next_id_ = 100;
  std::unordered_map<int32_t, PendingCommand> pending_;
  CloseHandler close_handler_;
};

} // namespace gsc::rcon
