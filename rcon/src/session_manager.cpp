#include "gsc_rcon/session_manager.h"

#include "gsc/events.h"

#include <algorithm>
#include <cerrno>
#include <sstream>

namespace gsc::rcon {

namespace {
using std::chrono::milliseconds;

CommandResult failed(const std::string& error) {
  CommandResult result;
  result.error = error;
  return result;
}

std::string trim(const std::string& text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) return {};
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}
} // namespace

const char* connection_state_name(ConnectionState state) {
  switch (state) {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting: return "connecting";
    case ConnectionState::Connected: return "connected";
  }
  return "unknown";
}

SessionManager::SessionManager(EventLoop& loop, EventBus& bus, ConnectionFactory factory,
                               Endpoint endpoint, RconSettings settings)
    : loop_(loop),
      bus_(bus),
      factory_(std::move(factory)),
      endpoint_(std::move(endpoint)),
      settings_(settings),
      connect_error_throttle_(milliseconds(settings.error_log_cooldown_ms)) {}

SessionManager::~SessionManager() {
  stop();
  ++version_;
  for (const auto& conn : pending_connections_) {
    conn->set_close_handler(nullptr);
    conn->close();
  }
  pending_connections_.clear();
  if (active_) {
    active_->set_close_handler(nullptr);
    active_->close();
    active_.reset();
  }
}

void SessionManager::start() {
  if (health_timer_ == kInvalidTimer) {
    health_timer_ = loop_.call_every(milliseconds(settings_.health_check_interval_ms),
                                     [this] { run_health_tick(); });
    log::info("RCON health check enabled (" +
              std::to_string(settings_.health_check_interval_ms / 1000) + "s interval)");
  }
  if (auto_reconnect_timer_ == kInvalidTimer) {
    auto_reconnect_timer_ = loop_.call_every(milliseconds(settings_.auto_reconnect_interval_ms),
                                             [this] { run_auto_reconnect_tick(); });
    log::info("RCON auto-reconnect enabled (" +
              std::to_string(settings_.auto_reconnect_interval_ms / 1000) + "s interval)");
  }
}

void SessionManager::stop() {
  loop_.cancel(health_timer_);
  loop_.cancel(auto_reconnect_timer_);
  loop_.cancel(starting_failsafe_timer_);
  health_timer_ = kInvalidTimer;
  auto_reconnect_timer_ = kInvalidTimer;
  starting_failsafe_timer_ = kInvalidTimer;
  health_failures_ = 0;
  disconnect();
}

Future<bool> SessionManager::connect() {
  if (connected()) {
    return make_ready_future(true);
  }
  if (connect_inflight_) {
    return connect_inflight_->future();
  }

  Promise<bool> promise;
  connect_inflight_ = promise;
  const uint64_t token = ++connect_token_;
  const uint64_t version = version_;
  state_ = ConnectionState::Connecting;

  if (!process_ || settings_.skip_server_check) {
    begin_handshake(promise, token, version);
    return promise.future();
  }

  // A probe that times out or fails falls through to the handshake.
  const Error timeout_error = transport_error(
      ETIMEDOUT, "server check timed out after " + std::to_string(settings_.server_check_timeout_ms) + "ms");
  with_timeout(loop_, process_->check_alive(), milliseconds(settings_.server_check_timeout_ms), timeout_error)
      .then([this, promise, token, version](const Outcome<bool>& outcome) {
        if (version != version_) {
          finish_connect(promise, token, false);
          return;
        }
        if (outcome.ok() && !*outcome.value) {
          log::debug("RCON: skipping connection - server is not running");
          if (token == connect_token_) {
            state_ = ConnectionState::Disconnected;
          }
          finish_connect(promise, token, false);
          return;
        }
        if (!outcome.ok()) {
          log::debug("RCON: server check failed (" + outcome.error.message + "), connecting anyway");
        }
        begin_handshake(promise, token, version);
      });
  return promise.future();
}

void SessionManager::begin_handshake(const Promise<bool>& promise, uint64_t token,
                                     uint64_t version) {
  auto conn = factory_();
  pending_connections_.push_back(conn);
  log::info("RCON: connecting to " + endpoint_.host + ":" + std::to_string(endpoint_.port) +
            " (version " + std::to_string(version) + ")");

  const auto timeout = milliseconds(settings_.connect_timeout_ms);
  const Error timeout_error = transport_error(
      ETIMEDOUT, "Authentication timed out after " + std::to_string(settings_.connect_timeout_ms) + "ms");
  with_timeout(loop_, conn->open(endpoint_), timeout, timeout_error)
      .then([this, promise, token, version, conn](const Outcome<Unit>& outcome) {
        pending_connections_.erase(
            std::remove(pending_connections_.begin(), pending_connections_.end(), conn),
            pending_connections_.end());

        if (version != version_) {
          log::info("RCON: connection attempt discarded (force reset occurred)");
          retire(conn);
          finish_connect(promise, token, false);
          return;
        }

        if (!outcome.ok()) {
          retire(conn);
          if (token == connect_token_ && !connected()) {
            state_ = ConnectionState::Disconnected;
          }
          log_connect_failure(outcome.error);
          if (token == connect_token_) {
            connect_inflight_.reset();
          }
          promise.reject(outcome.error);
          return;
        }

        if (active_ && active_ != conn) {
          retire(active_);
        }
        active_ = conn;
        state_ = ConnectionState::Connected;
        reconnect_attempts_ = 0;
        connect_error_throttle_.reset();
        const RconConnection* raw = conn.get();
        conn->set_close_handler([this, raw](const Error& error) { on_connection_lost(raw, error); });
        log::info("RCON connected to " + endpoint_.host + ":" + std::to_string(endpoint_.port));
        bus_.emit(RconConnected{endpoint_.host, endpoint_.port});
        finish_connect(promise, token, true);
      });
}

void SessionManager::finish_connect(const Promise<bool>& promise, uint64_t token, bool result) {
  if (token == connect_token_) {
    connect_inflight_.reset();
  }
  promise.resolve(result);
}

void SessionManager::log_connect_failure(const Error& error) {
  if (!connect_error_throttle_.allow(loop_.now())) {
    return;
  }
  if (is_retryable(error)) {
    log::warn("RCON connection failed (server may be offline): " + error.message);
  } else {
    log::error(std::string("RCON connection failed (") + error_kind_name(error.kind) + "): " + error.message);
  }
}

void SessionManager::disconnect() {
  const bool was_connected = state_ == ConnectionState::Connected;
  if (active_) {
    retire(active_);
    active_.reset();
  }
  state_ = connect_inflight_ ? ConnectionState::Connecting : ConnectionState::Disconnected;
  last_successful_command_.reset();
  if (was_connected) {
    log::info("RCON disconnected");
    bus_.emit(RconDisconnected{"disconnect"});
  }
}

Future<bool> SessionManager::reconnect() {
  if (server_starting_) {
    log::debug("RCON reconnect: skipping - server is starting");
    return make_ready_future(false);
  }
  if (connected()) {
    return make_ready_future(true);
  }
  if (reconnect_inflight_) {
    log::debug("RCON reconnect: already in progress, joining existing attempt");
    return reconnect_inflight_->future();
  }
  if (connect_inflight_) {
    log::debug("RCON reconnect: connection in progress, waiting");
    Promise<bool> joined;
    connect_inflight_->future().then([this, joined](const Outcome<bool>& outcome) {
      if (outcome.ok()) {
        joined.resolve(*outcome.value);
        return;
      }
      if (outcome.error.kind == ErrorKind::Auth) {
        joined.reject(outcome.error);
        return;
      }
      start_reconnect().then([joined](const Outcome<bool>& next) { joined.settle(next); });
    });
    return joined.future();
  }
  return start_reconnect();
}

Future<bool> SessionManager::start_reconnect() {
  if (reconnect_inflight_) {
    return reconnect_inflight_->future();
  }
  if (connected()) {
    return make_ready_future(true);
  }
  if (server_starting_) {
    return make_ready_future(false);
  }
  Promise<bool> promise;
  reconnect_inflight_ = promise;
  const uint64_t token = ++reconnect_token_;
  const uint64_t version = version_;
  disconnect();
  reconnect_attempt(promise, token, version);
  return promise.future();
}

void SessionManager::reconnect_attempt(const Promise<bool>& promise, uint64_t token,
                                       uint64_t version) {
  if (version != version_) {
    log::debug("RCON reconnect: version changed (force reset), aborting");
    finish_reconnect(promise, token, false);
    return;
  }
  if (reconnect_attempts_ >= settings_.max_reconnect_attempts) {
    log::warn("RCON reconnect: max attempts (" + std::to_string(settings_.max_reconnect_attempts) +
              ") reached, giving up");
    finish_reconnect(promise, token, false);
    return;
  }

  ++reconnect_attempts_;
  const int delay_ms = std::min(settings_.reconnect_base_delay_ms * reconnect_attempts_,
                                settings_.reconnect_max_delay_ms);
  log::info("RCON reconnecting... attempt " + std::to_string(reconnect_attempts_) + " in " +
            std::to_string(delay_ms) + "ms");

  reconnect_timer_ = loop_.call_later(milliseconds(delay_ms), [this, promise, token, version] {
    reconnect_timer_ = kInvalidTimer;
    if (version != version_) {
      log::debug("RCON reconnect: version changed (force reset), aborting");
      finish_reconnect(promise, token, false);
      return;
    }
    if (server_starting_) {
      log::debug("RCON reconnect: server starting, aborting reconnect loop");
      finish_reconnect(promise, token, false);
      return;
    }
    if (connected()) {
      finish_reconnect(promise, token, true);
      return;
    }
    connect().then([this, promise, token, version](const Outcome<bool>& outcome) {
      if (outcome.ok()) {
        if (*outcome.value && connected()) {
          log::info("RCON reconnected successfully");
          finish_reconnect(promise, token, true);
        } else {
          log::debug("RCON reconnect: server not running, stopping attempts");
          finish_reconnect(promise, token, false);
        }
        return;
      }
      // A wrong password will not fix itself.
      if (outcome.error.kind == ErrorKind::Auth) {
        log::error("RCON reconnect: " + outcome.error.message + ", not retrying");
        fail_reconnect(promise, token, outcome.error);
        return;
      }
      log::debug("RCON reconnect attempt " + std::to_string(reconnect_attempts_) +
                 " failed: " + outcome.error.message);
      reconnect_attempt(promise, token, version);
    });
  });
}

void SessionManager::finish_reconnect(const Promise<bool>& promise, uint64_t token, bool result) {
  if (token == reconnect_token_) {
    reconnect_inflight_.reset();
    reconnect_attempts_ = 0;
  }
  promise.resolve(result);
}

void SessionManager::fail_reconnect(const Promise<bool>& promise, uint64_t token, const Error& error) {
  if (token == reconnect_token_) {
    reconnect_inflight_.reset();
    reconnect_attempts_ = 0;
  }
  promise.reject(error);
}

Future<CommandResult> SessionManager::execute(const std::string& command) {
  if (server_starting_) {
    return make_ready_future(failed(user_message(make_error(ErrorKind::ServerStarting, {}))));
  }
  Promise<CommandResult> promise;
  if (connected()) {
    run_command(command, promise, true);
    return promise.future();
  }
  connect().then([this, command, promise](const Outcome<bool>& outcome) {
    if (outcome.ok() && !*outcome.value) {
      promise.resolve(failed("Server is not running"));
      return;
    }
    if (!outcome.ok()) {
      on_command_error(command, outcome.error, promise, true);
      return;
    }
    run_command(command, promise, true);
  });
  return promise.future();
}

void SessionManager::run_command(const std::string& command, const Promise<CommandResult>& promise,
                                 bool allow_retry) {
  if (!connected()) {
    on_command_error(command, transport_error(ENOTCONN, "rcon not connected"), promise, allow_retry);
    return;
  }
  log::debug("RCON executing: " + command);
  const Error timeout_error = transport_error(ETIMEDOUT, "rcon command timed out");
  with_timeout(loop_, active_->execute(command), milliseconds(settings_.command_timeout_ms),
               timeout_error)
      .then([this, command, promise, allow_retry](const Outcome<std::string>& outcome) {
        if (outcome.ok()) {
          last_successful_command_ = loop_.now();
          CommandResult result;
          result.success = true;
          result.response = outcome.value->empty() ? "Command executed successfully" : *outcome.value;
          log::debug("RCON response: " + *outcome.value);
          promise.resolve(std::move(result));
          return;
        }
        on_command_error(command, outcome.error, promise, allow_retry);
      });
}

void SessionManager::on_command_error(const std::string& command, const Error& error,
                                      const Promise<CommandResult>& promise, bool allow_retry) {
  if (!is_transport_failure(error)) {
    log::warn(std::string("RCON command failed (") + error_kind_name(error.kind) + "): " + error.message);
    promise.resolve(failed(user_message(error)));
    return;
  }

  log::debug("RCON command skipped (connection error): " + command + " (" + error.message + ")");
  mark_disconnected(error.message);

  if (server_starting_) {
    promise.resolve(failed("Server is starting, please wait..."));
    return;
  }
  if (!allow_retry) {
    promise.resolve(failed(user_message(error)));
    return;
  }

  reconnect().then([this, command, promise, error](const Outcome<bool>& outcome) {
    if (outcome.ok() && *outcome.value && connected()) {
      run_command(command, promise, false);
      return;
    }
    if (!outcome.ok()) {
      promise.resolve(failed(user_message(outcome.error)));
      return;
    }
    promise.resolve(failed("RCON reconnection failed"));
  });
}

Future<HealthStatus> SessionManager::health_check() {
  if (!connected()) {
    return make_ready_future(HealthStatus{false, "Not connected"});
  }
  Promise<HealthStatus> promise;
  auto conn = active_;
  const Error timeout_error = transport_error(ETIMEDOUT, "health probe timed out");
  with_timeout(loop_, conn->execute("players"), milliseconds(settings_.command_timeout_ms),
               timeout_error)
      .then([this, promise, conn](const Outcome<std::string>& outcome) {
        if (outcome.ok()) {
          last_successful_command_ = loop_.now();
          promise.resolve(HealthStatus{true, {}});
          return;
        }
        log::warn("RCON health check failed: " + outcome.error.message);
        if (active_ == conn) {
          mark_disconnected(outcome.error.message);
        }
        promise.resolve(HealthStatus{false, outcome.error.message});
      });
  return promise.future();
}

void SessionManager::run_health_tick() {
  if (!connected() || server_starting_ || health_probe_running_) {
    return;
  }
  health_probe_running_ = true;
  health_check().then([this](const Outcome<HealthStatus>& outcome) {
    health_probe_running_ = false;
    if (outcome.ok() && outcome.value->healthy) {
      health_failures_ = 0;
      log::debug("RCON health check: OK");
      return;
    }
    ++health_failures_;
    const std::string reason = outcome.ok() ? outcome.value->reason : outcome.error.message;
    log::warn("RCON health check failed (" + std::to_string(health_failures_) + "/" +
              std::to_string(settings_.max_health_failures) + "): " + reason);
    if (health_failures_ >= settings_.max_health_failures) {
      log::error("RCON health check: too many failures, forcing reset");
      force_reset_connection_state();
    }
  });
}

void SessionManager::run_auto_reconnect_tick() {
  if (connected() || server_starting_ || connect_inflight_ || reconnect_inflight_) {
    return;
  }
  if (process_ && !process_->is_alive()) {
    return;
  }
  log::info("RCON auto-reconnect: attempting connection");
  connect().then([](const Outcome<bool>& outcome) {
    if (outcome.ok() && *outcome.value) {
      log::info("RCON auto-reconnect: connected");
    } else if (!outcome.ok()) {
      log::debug("RCON auto-reconnect: connection failed: " + outcome.error.message);
    }
  });
}

void SessionManager::force_reset_connection_state(bool keep_server_starting) {
  ++version_;
  log::info("RCON: force resetting connection state (version " + std::to_string(version_) + ")");

  std::optional<Promise<bool>> connect_promise = std::move(connect_inflight_);
  connect_inflight_.reset();
  ++connect_token_;
  std::optional<Promise<bool>> reconnect_promise = std::move(reconnect_inflight_);
  reconnect_inflight_.reset();
  ++reconnect_token_;
  loop_.cancel(reconnect_timer_);
  reconnect_timer_ = kInvalidTimer;

  reconnect_attempts_ = 0;
  health_failures_ = 0;
  state_ = ConnectionState::Disconnected;
  last_successful_command_.reset();

  if (!keep_server_starting) {
    loop_.cancel(starting_failsafe_timer_);
    starting_failsafe_timer_ = kInvalidTimer;
    server_starting_ = false;
  }

  auto pending = std::move(pending_connections_);
  pending_connections_.clear();
  for (const auto& conn : pending) {
    retire(conn);
  }
  if (active_) {
    retire(active_);
    active_.reset();
  }

  bus_.emit(RconDisconnected{"reset"});

  if (connect_promise) {
    connect_promise->resolve(false);
  }
  if (reconnect_promise) {
    reconnect_promise->resolve(false);
  }
}

void SessionManager::set_server_starting(bool starting) {
  server_starting_ = starting;
  loop_.cancel(starting_failsafe_timer_);
  starting_failsafe_timer_ = kInvalidTimer;
  if (!starting) {
    return;
  }
  starting_failsafe_timer_ =
      loop_.call_later(milliseconds(settings_.server_starting_failsafe_ms), [this] {
        starting_failsafe_timer_ = kInvalidTimer;
        if (server_starting_) {
          log::warn("RCON: server-starting guard stuck for " +
                    std::to_string(settings_.server_starting_failsafe_ms / 1000) + "s, clearing it");
          server_starting_ = false;
        }
      });
}

void SessionManager::update_settings(const Endpoint& endpoint) {
  endpoint_ = endpoint;
  log::info("RCON settings updated: " + endpoint_.host + ":" + std::to_string(endpoint_.port));
  if (connected()) {
    disconnect();
  }
}

void SessionManager::on_connection_lost(const RconConnection* connection, const Error& error) {
  if (active_.get() != connection) {
    return;
  }
  log::warn("RCON connection lost: " + error.message);
  mark_disconnected(error.message);
}

void SessionManager::mark_disconnected(const std::string& reason) {
  const bool was_connected = state_ == ConnectionState::Connected;
  if (active_) {
    retire(active_);
    active_.reset();
  }
  if (!connect_inflight_) {
    state_ = ConnectionState::Disconnected;
  }
  if (was_connected) {
    bus_.emit(RconDisconnected{reason});
  }
}

void SessionManager::retire(const std::shared_ptr<RconConnection>& connection) {
  connection->set_close_handler(nullptr);
  connection->close();
  // Callers may be inside one of this connection's callbacks; release it on the next turn.
  loop_.post([connection] {});
}

Future<CommandResult> SessionManager::save() {
  return execute("save");
}

Future<CommandResult> SessionManager::quit() {
  if (server_starting_) {
    return make_ready_future(failed("Server is starting, please wait..."));
  }
  Promise<CommandResult> promise;
  auto finish = [this, promise](const CommandResult& result) {
    if (result.success) {
      mark_disconnected("quit");
      promise.resolve(result);
      return;
    }
    promise.resolve(result);
  };
  auto send = [this, finish] {
    auto conn = active_;
    const Error timeout_error = transport_error(ETIMEDOUT, "rcon command timed out");
    with_timeout(loop_, conn->execute("quit"), milliseconds(settings_.command_timeout_ms),
                 timeout_error)
        .then([finish](const Outcome<std::string>& outcome) {
          CommandResult result;
          if (outcome.ok()) {
            result.success = true;
            result.response = outcome.value->empty() ? "Command executed successfully" : *outcome.value;
          } else if (is_transport_failure(outcome.error)) {
            // The server closes the socket as it shuts down.
            result.success = true;
            result.response = "Server shutting down";
          } else {
            result.error = user_message(outcome.error);
          }
          finish(result);
        });
  };
  if (connected()) {
    send();
    return promise.future();
  }
  connect().then([this, promise, send](const Outcome<bool>& outcome) {
    if (!outcome.ok()) {
      promise.resolve(failed(user_message(outcome.error)));
      return;
    }
    if (!*outcome.value || !connected()) {
      promise.resolve(failed("Server is not running"));
      return;
    }
    send();
  });
  return promise.future();
}

Future<CommandResult> SessionManager::server_message(const std::string& message) {
  return execute("servermsg \"" + sanitize(message) + "\"");
}

Future<PlayersResult> SessionManager::players() {
  Promise<PlayersResult> promise;
  execute("players").then([promise](const Outcome<CommandResult>& outcome) {
    PlayersResult result;
    if (outcome.ok() && outcome.value->success) {
      result.success = true;
      result.players = parse_players(outcome.value->response);
    } else {
      result.error = outcome.ok() ? outcome.value->error : outcome.error.message;
    }
    promise.resolve(std::move(result));
  });
  return promise.future();
}

Future<CommandResult> SessionManager::kick(const std::string& user, const std::string& reason) {
  const std::string safe_reason = sanitize(reason);
  std::string command = "kick \"" + sanitize(user) + "\"";
  if (!safe_reason.empty()) {
    command += " -r \"" + safe_reason + "\"";
  }
  return execute(command);
}

Future<CommandResult> SessionManager::ban(const std::string& user, bool ban_ip,
                                          const std::string& reason) {
  const std::string safe_reason = sanitize(reason);
  std::string command = "banuser \"" + sanitize(user) + "\"";
  if (ban_ip) {
    command += " -ip";
  }
  if (!safe_reason.empty()) {
    command += " -r \"" + safe_reason + "\"";
  }
  return execute(command);
}

std::string SessionManager::sanitize(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char c : input) {
    if (c != '"' && c != '\\') {
      out.push_back(c);
    }
  }
  return out;
}

std::vector<std::string> SessionManager::parse_players(const std::string& response) {
  std::vector<std::string> players;
  std::istringstream in(response);
  std::string line;
  while (std::getline(in, line)) {
    const std::string trimmed = trim(line);
    if (!trimmed.empty() && trimmed.front() == '-') {
      const std::string name = trim(trimmed.substr(1));
      if (!name.empty()) {
        players.push_back(name);
      }
    }
  }
  return players;
}

} // namespace gsc::rcon
