#pragma once

#include "gsc/config.h"
#include "gsc/event_bus.h"
#include "gsc/event_loop.h"
#include "gsc/future.h"
#include "gsc/log.h"
#include "gsc_platform/process_controller.h"
#include "gsc_rcon/connection.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gsc::rcon {

enum class ConnectionState { Disconnected, Connecting, Connected };

const char* connection_state_name(ConnectionState state);

struct CommandResult {
  bool success = false;
  std::string response;
  std::string error;
};

struct HealthStatus {
  bool healthy = false;
  std::string reason;
};

struct PlayersResult {
  bool success = false;
  std::vector<std::string> players;
  std::string error;
};

// Owns the single authenticated RCON connection. Every public operation runs
// on the loop thread; concurrent callers share in-flight connect/reconnect
// attempts. A version counter invalidates attempts that straddle a forced reset.
class SessionManager {
 public:
  SessionManager(EventLoop& loop, EventBus& bus, ConnectionFactory factory, Endpoint endpoint,
                 RconSettings settings);
  ~SessionManager();

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  // Optional; enables the pre-connect process probe and background auto-reconnect.
  void set_process_controller(platform::ProcessController* process) { process_ = process; }

  // Starts the health-check and auto-reconnect timers.
  void start();
  void stop();

  // Resolves true when connected, false when the server process is not running
  // (or the attempt was invalidated by a reset). Rejects with Transport/Auth errors.
  Future<bool> connect();
  void disconnect();
  // Resolves true once connected again, false when attempts run out or are
  // invalidated. Rejects with the Auth error when the password is refused.
  Future<bool> reconnect();
  Future<CommandResult> execute(const std::string& command);
  Future<HealthStatus> health_check();
  void force_reset_connection_state(bool keep_server_starting = false);

  void set_server_starting(bool starting);
  bool server_starting() const { return server_starting_; }

  void update_settings(const Endpoint& endpoint);

  Future<CommandResult> save();
  // A dropped connection while quitting counts as a successful shutdown.
  Future<CommandResult> quit();
  Future<CommandResult> server_message(const std::string& message);
  Future<PlayersResult> players();
  Future<CommandResult> kick(const std::string& user, const std::string& reason = {});
  Future<CommandResult> ban(const std::string& user, bool ban_ip = false,
                            const std::string& reason = {});

  static std::string sanitize(const std::string& input);
  static std::vector<std::string> parse_players(const std::string& response);

  ConnectionState state() const { return state_; }
  bool connected() const { return state_ == ConnectionState::Connected && active_ != nullptr; }
  uint64_t version() const { return version_; }
  int reconnect_attempts() const { return reconnect_attempts_; }
  int health_failures() const { return health_failures_; }
  const Endpoint& endpoint() const { return endpoint_; }

 private:
  void begin_handshake(const Promise<bool>& promise, uint64_t token, uint64_t version);
  void finish_connect(const Promise<bool>& promise, uint64_t token, bool result);
  Future<bool> start_reconnect();
  void reconnect_attempt(const Promise<bool>& promise, uint64_t token, uint64_t version);
  void finish_reconnect(const Promise<bool>& promise, uint64_t token, bool result);
  void fail_reconnect(const Promise<bool>& promise, uint64_t token, const Error& error);

  void run_command(const std::string& command, const Promise<CommandResult>& promise,
                   bool allow_retry);
  void on_command_error(const std::string& command, const Error& error,
                        const Promise<CommandResult>& promise, bool allow_retry);
  void on_connection_lost(const RconConnection* connection, const Error& error);
  void mark_disconnected(const std::string& reason);
  void retire(const std::shared_ptr<RconConnection>& connection);
  void log_connect_failure(const Error& error);

  void run_health_tick();
  void run_auto_reconnect_tick();

  EventLoop& loop_;
  EventBus& bus_;
  ConnectionFactory factory_;
  Endpoint endpoint_;
  RconSettings settings_;
  platform::ProcessController* process_ = nullptr;

  ConnectionState state_ = ConnectionState::Disconnected;
  uint64_t version_ = 0;
  std::shared_ptr<RconConnection> active_;
  std::vector<std::shared_ptr<RconConnection>> pending_connections_;

  std::optional<Promise<bool>> connect_inflight_;
  uint64_t connect_token_ = 0;
  std::optional<Promise<bool>> reconnect_inflight_;
  uint64_t reconnect_token_ = 0;
  TimerId reconnect_timer_ = kInvalidTimer;
  int reconnect_attempts_ = 0;

  bool server_starting_ = false;
  TimerId starting_failsafe_timer_ = kInvalidTimer;

  TimerId health_timer_ = kInvalidTimer;
  TimerId auto_reconnect_timer_ = kInvalidTimer;
  int health_failures_ = 0;
  bool health_probe_running_ = false;
  std::optional<Clock::time_point> last_successful_command_;
  log::Throttle connect_error_throttle_;
};

} // namespace gsc::rcon
