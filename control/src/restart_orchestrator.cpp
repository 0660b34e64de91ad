#include "gsc_control/restart_orchestrator.h"

#include "gsc/events.h"
#include "gsc/log.h"

#include <cerrno>

namespace gsc::control {

namespace {
using std::chrono::milliseconds;

RestartOutcome immediate_failure(const std::string& phase, const std::string& message) {
  RestartOutcome outcome;
  outcome.phase = phase;
  outcome.message = message;
  return outcome;
}
} // namespace

const char* restart_phase_name(RestartPhase phase) {
  switch (phase) {
    case RestartPhase::Idle: return "idle";
    case RestartPhase::VerifyingRcon: return "verifying-rcon";
    case RestartPhase::Warning: return "warning";
    case RestartPhase::Saving: return "saving";
    case RestartPhase::Stopping: return "stopping";
    case RestartPhase::WaitingForDeath: return "waiting-for-death";
    case RestartPhase::Starting: return "starting";
    case RestartPhase::WaitingForProcess: return "waiting-for-process";
    case RestartPhase::ReconnectingRcon: return "reconnecting-rcon";
    case RestartPhase::Done: return "done";
    case RestartPhase::Failed: return "failed";
    case RestartPhase::Cancelled: return "cancelled";
  }
  return "unknown";
}

RestartOrchestrator::RestartOrchestrator(EventLoop& loop, EventBus& bus, rcon::SessionManager& session,
                                         platform::ProcessController& process, RestartSettings settings)
    : loop_(loop), bus_(bus), session_(session), process_(process), settings_(std::move(settings)) {}

RestartOrchestrator::~RestartOrchestrator() {
  loop_.cancel(wait_timer_);
  if (run_) {
    const Promise<RestartOutcome> promise = run_->promise;
    run_.reset();
    promise.reject(make_error(ErrorKind::Cancelled, "restart orchestrator destroyed"));
  }
}

Future<RestartOutcome> RestartOrchestrator::perform_restart(int warning_minutes) {
  if (run_) {
    log::warn("restart: request rejected, a restart is already in progress");
    return make_ready_future(immediate_failure("busy", "Restart already in progress"));
  }

  Run run;
  run.id = ++next_run_id_;
  run.started_at = loop_.now();
  run.warning_minutes = warning_minutes < 0 ? 0 : warning_minutes;
  auto future = run.promise.future();
  run_ = std::move(run);

  log::info("restart: requested with " + std::to_string(run_->warning_minutes) + " minute warning");
  detect_running(run_->id);
  return future;
}

bool RestartOrchestrator::cancel_restart() {
  if (!run_) {
    return false;
  }
  if (phase_ != RestartPhase::VerifyingRcon && phase_ != RestartPhase::Warning) {
    log::warn(std::string("restart: cannot cancel during phase ") + restart_phase_name(phase_));
    return false;
  }
  if (run_->cancelled) {
    return true;
  }
  run_->cancelled = true;
  log::info("restart: cancellation requested");

  // Skip the rest of the current countdown wait; the next step sees the flag.
  if (wait_timer_ != kInvalidTimer) {
    loop_.cancel(wait_timer_);
    wait_timer_ = kInvalidTimer;
    Step step = std::move(pending_step_);
    pending_step_ = nullptr;
    if (step) {
      step();
    }
  }
  return true;
}

Future<RestartOutcome> RestartOrchestrator::trigger_mod_update_restart() {
  if (mod_update_pending_) {
    log::info("restart: mod update restart already pending");
    return make_ready_future(immediate_failure("busy", "Mod update restart already pending"));
  }
  mod_update_pending_ = true;
  const int minutes = settings_.mod_update_warning_minutes;
  notify("Mod update detected! Server will restart in " + std::to_string(minutes) +
         " minute(s) to apply the update.");

  Promise<RestartOutcome> promise;
  perform_restart(minutes).then([this, promise](const Outcome<RestartOutcome>& outcome) {
    mod_update_pending_ = false;
    promise.settle(outcome);
  });
  return promise.future();
}

void RestartOrchestrator::set_phase(RestartPhase phase, const std::string& message) {
  phase_ = phase;
  log::info(std::string("restart [") + restart_phase_name(phase) + "]: " + message);
  bus_.emit(RestartPhaseChanged{restart_phase_name(phase), message});
}

void RestartOrchestrator::wait(int ms, Step next) {
  loop_.cancel(wait_timer_);
  pending_step_ = std::move(next);
  wait_timer_ = loop_.call_later(milliseconds(ms), [this] {
    wait_timer_ = kInvalidTimer;
    Step step = std::move(pending_step_);
    pending_step_ = nullptr;
    if (step) {
      step();
    }
  });
}

void RestartOrchestrator::finish(bool success, const std::string& phase, const std::string& message) {
  if (!run_) {
    return;
  }
  loop_.cancel(wait_timer_);
  wait_timer_ = kInvalidTimer;
  pending_step_ = nullptr;

  RestartOutcome outcome;
  outcome.success = success;
  outcome.was_running = run_->was_running;
  outcome.phase = phase;
  outcome.message = message;
  outcome.duration = std::chrono::duration_cast<milliseconds>(loop_.now() - run_->started_at);

  RestartPhase final_phase = RestartPhase::Done;
  if (phase == restart_phase_name(RestartPhase::Cancelled)) {
    final_phase = RestartPhase::Cancelled;
  } else if (!success) {
    final_phase = RestartPhase::Failed;
  }
  const Promise<RestartOutcome> promise = run_->promise;
  run_.reset();

  if (success) {
    log::info("restart: finished in " + std::to_string(outcome.duration.count() / 1000) + "s (" + phase + ")");
  } else {
    log::warn("restart: " + message);
  }
  set_phase(final_phase, message);
  phase_ = RestartPhase::Idle;
  promise.resolve(std::move(outcome));
}

void RestartOrchestrator::notify(const std::string& message) {
  session_.server_message(message).then([message](const Outcome<rcon::CommandResult>& outcome) {
    if (!outcome.ok() || !outcome.value->success) {
      const std::string reason = outcome.ok() ? outcome.value->error : outcome.error.message;
      log::warn("restart: failed to send notice \"" + message + "\": " + reason);
    }
  });
}

void RestartOrchestrator::detect_running(uint64_t id) {
  if (process_.is_alive() || session_.connected()) {
    run_->was_running = true;
    verify_rcon(id);
    return;
  }
  // The process probe can miss a server launched under a different command line.
  session_.players().then([this, id](const Outcome<rcon::PlayersResult>& outcome) {
    if (!current(id)) return;
    if (outcome.ok() && outcome.value->success) {
      run_->was_running = true;
      verify_rcon(id);
      return;
    }
    fast_start(id);
  });
}

void RestartOrchestrator::fast_start(uint64_t id) {
  set_phase(RestartPhase::Starting, "Server is not running, starting it");
  std::string error;
  if (!process_.launch(error)) {
    finish(false, restart_phase_name(RestartPhase::Failed), "Failed to start server: " + error);
    return;
  }
  set_phase(RestartPhase::WaitingForProcess, "Waiting for server process");
  poll_alive(id, 0, [this](bool alive) {
    if (alive) {
      finish(true, restart_phase_name(RestartPhase::Done), "Server started");
    } else {
      finish(false, restart_phase_name(RestartPhase::Failed), "Server process did not start");
    }
  });
}

void RestartOrchestrator::poll_alive(uint64_t id, int attempt, std::function<void(bool)> done) {
  if (!current(id)) return;
  if (process_.is_alive()) {
    done(true);
    return;
  }
  if (attempt + 1 >= settings_.alive_poll_attempts) {
    done(false);
    return;
  }
  wait(settings_.alive_poll_interval_ms, [this, id, attempt, done] { poll_alive(id, attempt + 1, done); });
}

void RestartOrchestrator::verify_rcon(uint64_t id) {
  set_phase(RestartPhase::VerifyingRcon, "Verifying RCON connection");

  auto probe = [this, id] {
    const Error timeout_error = transport_error(ETIMEDOUT, "RCON probe timed out");
    with_timeout(loop_, session_.players(), milliseconds(settings_.verify_timeout_ms), timeout_error)
        .then([this, id](const Outcome<rcon::PlayersResult>& outcome) {
          if (!current(id)) return;
          if (!outcome.ok() || !outcome.value->success) {
            const std::string reason = outcome.ok() ? outcome.value->error : user_message(outcome.error);
            finish(false, restart_phase_name(RestartPhase::Failed),
                   "RCON not available: " + (reason.empty() ? std::string("connection failed") : reason));
            return;
          }
          abort_if_cancelled(id, [this, id] {
            set_phase(RestartPhase::Warning, "Warning players");
            if (run_->warning_minutes == 0) {
              notify("Server restarting NOW!");
              wait(settings_.immediate_now_wait_ms, [this, id] { abort_if_cancelled(id, [this, id] { save_world(id); }); });
              return;
            }
            countdown(id, run_->warning_minutes);
          });
        });
  };

  if (session_.connected()) {
    probe();
    return;
  }
  session_.connect().then([this, id, probe](const Outcome<bool>& outcome) {
    if (!current(id)) return;
    if (!outcome.ok()) {
      finish(false, restart_phase_name(RestartPhase::Failed),
             "RCON not available: " + user_message(outcome.error));
      return;
    }
    if (!*outcome.value) {
      finish(false, restart_phase_name(RestartPhase::Failed), "RCON not available: connection failed");
      return;
    }
    probe();
  });
}

void RestartOrchestrator::countdown(uint64_t id, int minutes_left) {
  notify("Server restarting in " + std::to_string(minutes_left) + " minute(s)!");
  if (minutes_left > 1) {
    wait(settings_.minute_interval_ms, [this, id, minutes_left] {
      abort_if_cancelled(id, [this, id, minutes_left] { countdown(id, minutes_left - 1); });
    });
    return;
  }
  wait(settings_.last_minute_wait_ms, [this, id] { abort_if_cancelled(id, [this, id] { final_warnings(id); }); });
}

void RestartOrchestrator::final_warnings(uint64_t id) {
  notify("Server restarting in 30 seconds!");
  wait(settings_.final_warning_wait_ms, [this, id] {
    abort_if_cancelled(id, [this, id] {
      notify("Server restarting NOW! Please reconnect in a few minutes.");
      wait(settings_.now_wait_ms, [this, id] { abort_if_cancelled(id, [this, id] { save_world(id); }); });
    });
  });
}

void RestartOrchestrator::abort_if_cancelled(uint64_t id, Step next) {
  if (!current(id)) return;
  if (!run_->cancelled) {
    next();
    return;
  }
  notify("Server restart has been cancelled.");
  finish(false, restart_phase_name(RestartPhase::Cancelled), "Restart cancelled");
}

void RestartOrchestrator::save_world(uint64_t id) {
  set_phase(RestartPhase::Saving, "Saving world");
  const Error timeout_error = transport_error(ETIMEDOUT, "save timed out");
  with_timeout(loop_, session_.save(), milliseconds(settings_.save_timeout_ms), timeout_error)
      .then([this, id](const Outcome<rcon::CommandResult>& outcome) {
        if (!current(id)) return;
        if (!outcome.ok() || !outcome.value->success) {
          const std::string reason = outcome.ok() ? outcome.value->error : outcome.error.message;
          log::warn("restart: save failed, continuing: " + reason);
        }
        wait(settings_.save_wait_ms, [this, id] { quit_server(id); });
      });
}

void RestartOrchestrator::quit_server(uint64_t id) {
  set_phase(RestartPhase::Stopping, "Stopping server");
  const Error timeout_error = transport_error(ETIMEDOUT, "quit timed out");
  with_timeout(loop_, session_.quit(), milliseconds(settings_.quit_timeout_ms), timeout_error)
      .then([this, id](const Outcome<rcon::CommandResult>& outcome) {
        if (!current(id)) return;
        if (!outcome.ok() || !outcome.value->success) {
          const std::string reason = outcome.ok() ? outcome.value->error : outcome.error.message;
          log::warn("restart: quit failed, waiting for the process anyway: " + reason);
        }
        wait(settings_.quit_wait_ms, [this, id] {
          set_phase(RestartPhase::WaitingForDeath, "Waiting for server process to exit");
          wait_for_death(id, 0);
        });
      });
}

void RestartOrchestrator::wait_for_death(uint64_t id, int attempt) {
  if (!current(id)) return;
  if (!process_.is_alive()) {
    relaunch(id);
    return;
  }
  if (attempt + 1 < settings_.death_poll_attempts) {
    wait(settings_.death_poll_interval_ms, [this, id, attempt] { wait_for_death(id, attempt + 1); });
    return;
  }
  log::warn("restart: server still running after " + std::to_string(settings_.death_poll_attempts) +
            " checks, killing it");
  std::string error;
  if (!process_.kill(error) && !error.empty()) {
    log::error("restart: kill failed: " + error);
  }
  wait(settings_.kill_wait_ms, [this, id] { relaunch(id); });
}

void RestartOrchestrator::relaunch(uint64_t id) {
  set_phase(RestartPhase::Starting, "Starting server");
  session_.set_server_starting(true);
  std::string error;
  if (!process_.launch(error)) {
    session_.set_server_starting(false);
    finish(false, restart_phase_name(RestartPhase::Failed), "Failed to start server: " + error);
    return;
  }
  set_phase(RestartPhase::WaitingForProcess, "Waiting for server process");
  poll_alive(id, 0, [this, id](bool alive) {
    if (!alive) {
      session_.set_server_starting(false);
      finish(false, restart_phase_name(RestartPhase::Failed), "Server process did not start after restart");
      return;
    }
    set_phase(RestartPhase::ReconnectingRcon, "Waiting for RCON to come back");
    staged_reconnect(id, 0);
  });
}

void RestartOrchestrator::staged_reconnect(uint64_t id, size_t stage) {
  if (!current(id)) return;
  if (stage >= settings_.rcon_wait_schedule_ms.size()) {
    session_.set_server_starting(false);
    finish(true, kPhaseStartedRconPending, "Server restarted; RCON not reachable yet");
    return;
  }
  wait(settings_.rcon_wait_schedule_ms[stage], [this, id, stage] {
    if (!current(id)) return;
    log::info("restart: RCON reconnect attempt " + std::to_string(stage + 1) + "/" +
              std::to_string(settings_.rcon_wait_schedule_ms.size()));
    session_.force_reset_connection_state(true);
    const Error timeout_error = transport_error(ETIMEDOUT, "RCON reconnect attempt timed out");
    with_timeout(loop_, session_.connect(), milliseconds(settings_.rcon_attempt_timeout_ms), timeout_error)
        .then([this, id, stage](const Outcome<bool>& outcome) {
          if (!current(id)) return;
          if (outcome.ok() && *outcome.value && session_.connected()) {
            session_.set_server_starting(false);
            finish(true, restart_phase_name(RestartPhase::Done), "Server restarted successfully");
            return;
          }
          log::debug("restart: RCON not ready: " +
                     (outcome.ok() ? std::string("connection failed") : outcome.error.message));
          session_.force_reset_connection_state(true);
          staged_reconnect(id, stage + 1);
        });
  });
}

} // namespace gsc::control
