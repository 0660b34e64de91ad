#pragma once

#include "gsc/config.h"
#include "gsc/event_bus.h"
#include "gsc/event_loop.h"
#include "gsc/future.h"
#include "gsc_platform/process_controller.h"
#include "gsc_rcon/session_manager.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace gsc::control {

enum class RestartPhase {
  Idle,
  VerifyingRcon,
  Warning,
  Saving,
  Stopping,
  WaitingForDeath,
  Starting,
  WaitingForProcess,
  ReconnectingRcon,
  Done,
  Failed,
  Cancelled,
};

const char* restart_phase_name(RestartPhase phase);

// Phase reported when the server came back but RCON did not within the schedule.
constexpr const char* kPhaseStartedRconPending = "started-rcon-pending";

struct RestartOutcome {
  bool success = false;
  bool was_running = false;
  std::string phase;
  std::string message;
  std::chrono::milliseconds duration{0};
};

// Sequences warn/save/quit/kill/relaunch/reconnect against the session manager
// and the process controller. One restart at a time; cancellation is honored
// only while the countdown is running.
class RestartOrchestrator {
 public:
  RestartOrchestrator(EventLoop& loop, EventBus& bus, rcon::SessionManager& session,
                      platform::ProcessController& process, RestartSettings settings);
  ~RestartOrchestrator();

  RestartOrchestrator(const RestartOrchestrator&) = delete;
  RestartOrchestrator& operator=(const RestartOrchestrator&) = delete;

  Future<RestartOutcome> perform_restart(int warning_minutes);
  Future<RestartOutcome> perform_restart() { return perform_restart(settings_.warning_minutes); }
  // Returns false when there is nothing left to cancel.
  bool cancel_restart();

  // Announces a mod update and restarts with the configured warning. Duplicate
  // triggers while one is pending resolve immediately without a second restart.
  Future<RestartOutcome> trigger_mod_update_restart();

  bool busy() const { return run_.has_value(); }
  bool mod_update_pending() const { return mod_update_pending_; }
  RestartPhase phase() const { return phase_; }

 private:
  struct Run {
    uint64_t id = 0;
    Promise<RestartOutcome> promise;
    Clock::time_point started_at;
    int warning_minutes = 0;
    bool was_running = false;
    bool cancelled = false;
  };

  using Step = std::function<void()>;

  void set_phase(RestartPhase phase, const std::string& message);
  void wait(int ms, Step next);
  void finish(bool success, const std::string& phase, const std::string& message);
  void notify(const std::string& message);
  bool current(uint64_t id) const { return run_ && run_->id == id; }

  void detect_running(uint64_t id);
  void fast_start(uint64_t id);
  void poll_alive(uint64_t id, int attempt, std::function<void(bool)> done);
  void verify_rcon(uint64_t id);
  void countdown(uint64_t id, int minutes_left);
  void final_warnings(uint64_t id);
  void abort_if_cancelled(uint64_t id, Step next);
  void save_world(uint64_t id);
  void quit_server(uint64_t id);
  void wait_for_death(uint64_t id, int attempt);
  void relaunch(uint64_t id);
  void staged_reconnect(uint64_t id, size_t stage);

  EventLoop& loop_;
  EventBus& bus_;
  rcon::SessionManager& session_;
  platform::ProcessController& process_;
  RestartSettings settings_;

  std::optional<Run> run_;
  uint64_t next_run_id_ = 0;
  RestartPhase phase_ = RestartPhase::Idle;
  TimerId wait_timer_ = kInvalidTimer;
  Step pending_step_;
  bool mod_update_pending_ = false;
};

} // namespace gsc::control
