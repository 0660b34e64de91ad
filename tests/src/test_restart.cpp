#include "fakes.h"

#include "gsc/event_bus.h"
#include "gsc/event_loop.h"
#include "gsc/events.h"
#include "gsc/log.h"
#include "gsc_control/restart_orchestrator.h"
#include "gsc_rcon/session_manager.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using std::chrono::milliseconds;
using gsc::testing::FakeProcessController;
using gsc::testing::FakeServer;

namespace {

struct SentCommand {
  std::string text;
  gsc::Clock::time_point at;
};

// One orchestrator wired to a scripted server and a fake process.
struct Harness {
  gsc::ManualClock clock;
  gsc::EventLoop loop{clock};
  gsc::EventBus bus;
  std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
  FakeProcessController process;
  gsc::RestartSettings settings;
  std::unique_ptr<gsc::rcon::SessionManager> session;
  std::unique_ptr<gsc::control::RestartOrchestrator> restarts;
  std::vector<SentCommand> sent;
  std::vector<std::string> phases;
  // When set, quit kills the process and the server refuses new connections.
  bool refuse_after_quit = false;

  explicit Harness(gsc::RestartSettings restart_settings = {}) : settings(std::move(restart_settings)) {
    session = std::make_unique<gsc::rcon::SessionManager>(
        loop, bus, gsc::testing::make_fake_factory(loop, server), gsc::rcon::Endpoint{}, gsc::RconSettings{});
    session->set_process_controller(&process);
    restarts = std::make_unique<gsc::control::RestartOrchestrator>(loop, bus, *session, process, settings);
    server->on_command = [this](const std::string& command) {
      sent.push_back({command, loop.now()});
      if (command == "quit") {
        process.alive = false;
        if (refuse_after_quit) {
          server->refuse = true;
        }
      }
    };
    bus.subscribe<gsc::RestartPhaseChanged>([this](const gsc::RestartPhaseChanged& ev) { phases.push_back(ev.phase); });
  }

  ~Harness() {
    restarts.reset();
    session.reset();
  }

  const SentCommand* find(const std::string& needle) const {
    for (const auto& cmd : sent) {
      if (cmd.text.find(needle) != std::string::npos) return &cmd;
    }
    return nullptr;
  }

  bool saw_phase(const std::string& phase) const {
    for (const auto& p : phases) {
      if (p == phase) return true;
    }
    return false;
  }

  gsc::control::RestartOutcome wait(const gsc::Future<gsc::control::RestartOutcome>& future,
                                    milliseconds limit = milliseconds(20 * 60 * 1000)) {
    loop.run_until([&future] { return future.ready(); }, limit);
    if (!future.ready() || !future.outcome().ok()) {
      return gsc::control::RestartOutcome{false, false, "unsettled", "restart did not finish", milliseconds(0)};
    }
    return *future.outcome().value;
  }
};

long long offset_ms(const SentCommand* from, const SentCommand* to) {
  return std::chrono::duration_cast<milliseconds>(to->at - from->at).count();
}

bool near(long long actual, long long expected) {
  return actual >= expected - 50 && actual <= expected + 50;
}

} // namespace

int main() {
  const fs::path temp_root = fs::temp_directory_path() / "gsc_restart_test";
  gsc::log::init("gsc_restart_tests", temp_root);

  int failures = 0;

  // Test: a stopped server is simply started.
  {
    Harness h;
    const auto outcome = h.wait(h.restarts->perform_restart(5));
    if (!outcome.success || outcome.was_running || h.process.launches != 1) {
      std::cerr << "fast path: " << outcome.message << "\n";
      ++failures;
    }
    if (h.find("save") || h.find("quit") || h.find("servermsg")) {
      std::cerr << "fast path must not warn, save or quit\n";
      ++failures;
    }
  }

  // Test: a fast-path launch failure is reported.
  {
    Harness h;
    h.process.launch_fails = true;
    const auto outcome = h.wait(h.restarts->perform_restart(0));
    if (outcome.success || outcome.message != "Failed to start server: executable not found") {
      std::cerr << "launch failure not reported: " << outcome.message << "\n";
      ++failures;
    }
  }

  // Test: the full sequence follows the warning timeline.
  {
    Harness h;
    h.process.alive = true;
    auto future = h.restarts->perform_restart(2);
    auto second = h.restarts->perform_restart(2);
    if (!second.ready() || second.outcome().value->success ||
        second.outcome().value->message != "Restart already in progress") {
      std::cerr << "concurrent restart should be rejected\n";
      ++failures;
    }

    bool guard_seen = false;
    h.bus.subscribe<gsc::RestartPhaseChanged>([&h, &guard_seen](const gsc::RestartPhaseChanged& ev) {
      if (ev.phase == "reconnecting-rcon") guard_seen = h.session->server_starting();
    });
    const auto outcome = h.wait(future);
    if (!outcome.success || !outcome.was_running || outcome.phase != "done") {
      std::cerr << "full restart failed: " << outcome.message << "\n";
      ++failures;
    }

    const auto* two = h.find("restarting in 2 minute(s)!");
    const auto* one = h.find("restarting in 1 minute(s)!");
    const auto* thirty = h.find("restarting in 30 seconds!");
    const auto* now = h.find("restarting NOW! Please reconnect");
    const auto* save = h.find("save");
    const auto* quit = h.find("quit");
    if (!two || !one || !thirty || !now || !save || !quit) {
      std::cerr << "missing countdown steps\n";
      ++failures;
    } else {
      if (offset_ms(two, one) != 60000 || offset_ms(two, thirty) != 90000 || offset_ms(two, now) != 115000) {
        std::cerr << "warning offsets wrong: " << offset_ms(two, one) << " " << offset_ms(two, thirty) << " "
                  << offset_ms(two, now) << "\n";
        ++failures;
      }
      if (!near(offset_ms(two, save), 120000) || !near(offset_ms(two, quit), 123000)) {
        std::cerr << "save/quit offsets wrong: " << offset_ms(two, save) << " " << offset_ms(two, quit) << "\n";
        ++failures;
      }
    }
    if (h.process.launches != 1 || h.process.kills != 0) {
      std::cerr << "relaunch counts wrong\n";
      ++failures;
    }
    if (!guard_seen || h.session->server_starting()) {
      std::cerr << "server-starting guard not held during reconnect or not cleared after\n";
      ++failures;
    }
    if (!h.session->connected()) {
      std::cerr << "session should be connected after the restart\n";
      ++failures;
    }
    if (!h.saw_phase("saving") || !h.saw_phase("waiting-for-death") || h.phases.back() != "done") {
      std::cerr << "phase events incomplete\n";
      ++failures;
    }
    // 123s to quit, 10s settle, then the first staged wait of 60s.
    if (outcome.duration < milliseconds(193000) || outcome.duration > milliseconds(194000)) {
      std::cerr << "duration wrong: " << outcome.duration.count() << "ms\n";
      ++failures;
    }
  }

  // Test: cancelling during the countdown stops before save.
  {
    Harness h;
    h.process.alive = true;
    auto future = h.restarts->perform_restart(5);
    h.loop.run_for(milliseconds(30000));
    if (!h.restarts->cancel_restart()) {
      std::cerr << "cancel during countdown refused\n";
      ++failures;
    }
    const auto outcome = h.wait(future, milliseconds(1000));
    if (outcome.success || outcome.phase != "cancelled" || outcome.message != "Restart cancelled") {
      std::cerr << "cancel outcome wrong: " << outcome.message << "\n";
      ++failures;
    }
    h.loop.run_for(milliseconds(1000));
    if (!h.find("Server restart has been cancelled.") || h.find("save") || h.find("quit") ||
        h.process.kills != 0 || h.process.launches != 0) {
      std::cerr << "cancelled restart still touched the server\n";
      ++failures;
    }
    if (h.restarts->cancel_restart() || h.restarts->busy()) {
      std::cerr << "nothing should be left to cancel\n";
      ++failures;
    }
  }

  // Test: RCON never returns, reported as started with RCON pending.
  {
    Harness h;
    h.process.alive = true;
    h.refuse_after_quit = true;
    auto future = h.restarts->perform_restart(0);
    const auto outcome = h.wait(future);
    const auto* now = h.find("Server restarting NOW!");
    const auto* save = h.find("save");
    if (!now || !save || !near(offset_ms(now, save), 2000)) {
      std::cerr << "immediate restart should save two seconds after the notice\n";
      ++failures;
    }
    if (!outcome.success || outcome.phase != "started-rcon-pending") {
      std::cerr << "expected started-rcon-pending, got " << outcome.phase << ": " << outcome.message << "\n";
      ++failures;
    }
    if (h.session->server_starting() || h.session->connected()) {
      std::cerr << "guard should be cleared and the session down\n";
      ++failures;
    }
    if (h.server->opens < 6) {
      std::cerr << "staged reconnect made " << h.server->opens << " opens\n";
      ++failures;
    }
  }

  // Test: a server that ignores quit is killed; a relaunch that never shows up fails.
  {
    gsc::RestartSettings settings;
    settings.death_poll_attempts = 3;
    settings.alive_poll_attempts = 3;
    Harness h(settings);
    h.process.alive = true;
    h.server->on_command = nullptr;
    h.process.launch_comes_alive = false;
    const auto outcome = h.wait(h.restarts->perform_restart(0));
    if (h.process.kills != 1 || h.process.launches != 1) {
      std::cerr << "stubborn server was not killed and relaunched\n";
      ++failures;
    }
    if (outcome.success || !outcome.was_running || outcome.message != "Server process did not start after restart") {
      std::cerr << "missing process not reported: " << outcome.message << "\n";
      ++failures;
    }
    if (h.session->server_starting()) {
      std::cerr << "guard left set after a failed relaunch\n";
      ++failures;
    }
  }

  // Test: a save that loses the connection is abandoned after its bound.
  {
    Harness h;
    h.process.alive = true;
    gsc::Clock::time_point saving_at{};
    gsc::Clock::time_point stopping_at{};
    h.bus.subscribe<gsc::RestartPhaseChanged>([&h, &saving_at, &stopping_at](const gsc::RestartPhaseChanged& ev) {
      if (ev.phase == "saving") {
        saving_at = h.loop.now();
        h.server->drop_next_executes = 1;
        h.server->refuse = true;
      } else if (ev.phase == "stopping") {
        stopping_at = h.loop.now();
      }
    });
    const auto outcome = h.wait(h.restarts->perform_restart(0));
    if (saving_at == gsc::Clock::time_point{} || stopping_at == gsc::Clock::time_point{}) {
      std::cerr << "save/stop phases not reached\n";
      ++failures;
    } else {
      // save_timeout_ms then save_wait_ms.
      const long long save_to_stop = std::chrono::duration_cast<milliseconds>(stopping_at - saving_at).count();
      if (!near(save_to_stop, h.settings.save_timeout_ms + h.settings.save_wait_ms)) {
        std::cerr << "save was not bounded: " << save_to_stop << "ms\n";
        ++failures;
      }
    }
    if (!outcome.success || outcome.phase != "started-rcon-pending" || h.process.kills != 1) {
      std::cerr << "restart after a lost save should still relaunch: " << outcome.phase << ": " << outcome.message
                << "\n";
      ++failures;
    }
  }

  // Test: a players check that never answers aborts after its bound.
  {
    Harness h;
    h.process.alive = true;
    auto up = h.session->connect();
    h.loop.run_until([&up] { return up.ready(); }, milliseconds(1000));
    h.server->drop_next_executes = 1;
    h.server->refuse = true;
    const auto outcome = h.wait(h.restarts->perform_restart(5));
    if (outcome.success ||
        outcome.message != "RCON not available: Connection timed out. Server may be unresponsive or firewall is blocking." ||
        outcome.duration > milliseconds(h.settings.verify_timeout_ms + 100)) {
      std::cerr << "stuck RCON check not bounded: " << outcome.message << " after " << outcome.duration.count()
                << "ms\n";
      ++failures;
    }
    if (!h.sent.empty() || h.process.launches != 0 || h.process.kills != 0) {
      std::cerr << "restart acted after a failed RCON check\n";
      ++failures;
    }
  }

  // Test: with default settings a server ignoring quit is killed within a minute.
  {
    Harness h;
    h.process.alive = true;
    h.server->on_command = nullptr;
    gsc::Clock::time_point stopping_at{};
    gsc::Clock::time_point starting_at{};
    h.bus.subscribe<gsc::RestartPhaseChanged>([&h, &stopping_at, &starting_at](const gsc::RestartPhaseChanged& ev) {
      if (ev.phase == "stopping") stopping_at = h.loop.now();
      if (ev.phase == "starting") starting_at = h.loop.now();
    });
    const auto outcome = h.wait(h.restarts->perform_restart(0));
    const long long kill_after_quit =
        std::chrono::duration_cast<milliseconds>(starting_at - stopping_at).count() - h.settings.kill_wait_ms;
    if (!outcome.success || h.process.kills != 1 || kill_after_quit <= 0 || kill_after_quit > 60000) {
      std::cerr << "forced kill came " << kill_after_quit << "ms after quit\n";
      ++failures;
    }
  }

  // Test: unreachable RCON aborts before any warning.
  {
    Harness h;
    h.process.alive = true;
    h.server->refuse = true;
    const auto outcome = h.wait(h.restarts->perform_restart(5));
    if (outcome.success || outcome.message.find("RCON not available: Cannot connect") != 0) {
      std::cerr << "unreachable RCON not reported: " << outcome.message << "\n";
      ++failures;
    }
    if (!h.sent.empty() || h.process.launches != 0) {
      std::cerr << "aborted restart still acted\n";
      ++failures;
    }
  }

  // Test: mod-update restarts collapse duplicates.
  {
    Harness h;
    h.process.alive = true;
    auto first = h.restarts->trigger_mod_update_restart();
    auto duplicate = h.restarts->trigger_mod_update_restart();
    if (!h.restarts->mod_update_pending() || !duplicate.ready() ||
        duplicate.outcome().value->message != "Mod update restart already pending") {
      std::cerr << "duplicate mod-update trigger not collapsed\n";
      ++failures;
    }
    h.restarts->cancel_restart();
    const auto outcome = h.wait(first, milliseconds(5000));
    if (outcome.phase != "cancelled" || h.restarts->mod_update_pending()) {
      std::cerr << "mod-update restart did not settle: " << outcome.message << "\n";
      ++failures;
    }
    if (!h.find("Mod update detected!")) {
      std::cerr << "mod-update notice not sent\n";
      ++failures;
    }
  }

  gsc::log::shutdown();
  std::error_code ec;
  fs::remove_all(temp_root, ec);
  if (failures == 0) {
    std::cout << "gsc_restart_tests: all passed\n";
  }
  return failures == 0 ? 0 : 1;
}
