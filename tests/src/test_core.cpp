#include "gsc/config.h"
#include "gsc/error.h"
#include "gsc/event_bus.h"
#include "gsc/event_loop.h"
#include "gsc/events.h"
#include "gsc/file_io.h"
#include "gsc/future.h"
#include "gsc/log.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;
using std::chrono::milliseconds;

namespace {
bool write_text(const fs::path& path, const std::string& contents) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  if (!out) return false;
  out << contents;
  return true;
}
} // namespace

int main() {
  const fs::path temp_root = fs::temp_directory_path() / "gsc_core_test";
  std::error_code ec;
  fs::remove_all(temp_root, ec);
  fs::create_directories(temp_root);
  gsc::log::init("gsc_core_tests", temp_root);

  int failures = 0;

  // Test: timers fire in deadline order on a virtual clock.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    std::vector<int> order;
    loop.call_later(milliseconds(300), [&order] { order.push_back(3); });
    loop.call_later(milliseconds(100), [&order] { order.push_back(1); });
    loop.call_later(milliseconds(200), [&order] { order.push_back(2); });
    const auto start = loop.now();
    loop.run_until([&order] { return order.size() == 3; }, milliseconds(1000));
    if (order != std::vector<int>{1, 2, 3}) {
      std::cerr << "timers fired out of order\n";
      ++failures;
    }
    if (loop.now() - start != milliseconds(300)) {
      std::cerr << "virtual clock did not stop at the last deadline\n";
      ++failures;
    }
  }

  // Test: cancelled timers never fire; repeating timers keep firing.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    bool fired = false;
    const auto id = loop.call_later(milliseconds(50), [&fired] { fired = true; });
    int ticks = 0;
    const auto every = loop.call_every(milliseconds(100), [&ticks] { ++ticks; });
    loop.cancel(id);
    loop.run_for(milliseconds(450));
    if (fired) {
      std::cerr << "cancelled timer fired\n";
      ++failures;
    }
    if (ticks != 4) {
      std::cerr << "repeating timer ticked " << ticks << " times, expected 4\n";
      ++failures;
    }
    loop.cancel(every);
    if (loop.timer_active(every) || loop.timer_count() != 0) {
      std::cerr << "repeating timer still active after cancel\n";
      ++failures;
    }
  }

  // Test: posted tasks run before timers due at the same time.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    std::vector<std::string> order;
    loop.call_later(milliseconds(0), [&order] { order.push_back("timer"); });
    loop.post([&order] { order.push_back("posted"); });
    loop.run_for(milliseconds(10));
    if (order.size() != 2 || order.front() != "posted") {
      std::cerr << "posted task did not run first\n";
      ++failures;
    }
  }

  // Test: futures settle once and late continuations still run.
  {
    gsc::Promise<int> promise;
    int seen = 0;
    promise.future().then([&seen](const gsc::Outcome<int>& out) { seen += out.ok() ? *out.value : -100; });
    if (!promise.resolve(7) || promise.resolve(8) || promise.reject(gsc::make_error(gsc::ErrorKind::Io, "x"))) {
      std::cerr << "promise settled more than once\n";
      ++failures;
    }
    promise.future().then([&seen](const gsc::Outcome<int>& out) { seen += *out.value; });
    if (seen != 14) {
      std::cerr << "continuations saw " << seen << ", expected 14\n";
      ++failures;
    }
  }

  // Test: with_timeout rejects when the timer wins and is inert otherwise.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    gsc::Promise<int> slow;
    auto raced = gsc::with_timeout(loop, slow.future(), milliseconds(100),
                                   gsc::transport_error(ETIMEDOUT, "slow"));
    loop.run_for(milliseconds(150));
    if (!raced.ready() || raced.outcome().ok() || raced.outcome().error.code != ETIMEDOUT) {
      std::cerr << "with_timeout did not reject on timeout\n";
      ++failures;
    }
    slow.resolve(1);
    if (raced.outcome().ok()) {
      std::cerr << "late value overrode the timeout\n";
      ++failures;
    }

    gsc::Promise<int> fast;
    auto ok = gsc::with_timeout(loop, fast.future(), milliseconds(100), gsc::make_error(gsc::ErrorKind::Io, "t"));
    loop.call_later(milliseconds(10), [fast] { fast.resolve(5); });
    loop.run_for(milliseconds(200));
    if (!ok.ready() || !ok.outcome().ok() || *ok.outcome().value != 5) {
      std::cerr << "with_timeout lost a fast value\n";
      ++failures;
    }
    if (loop.timer_count() != 0) {
      std::cerr << "with_timeout left its timer behind\n";
      ++failures;
    }
  }

  // Test: event bus delivery, unsubscribe and emit snapshots.
  {
    gsc::EventBus bus;
    int connected = 0;
    int late = 0;
    gsc::SubscriptionId late_id = 0;
    const auto id = bus.subscribe<gsc::RconConnected>([&](const gsc::RconConnected& ev) {
      connected += ev.port == 27015 ? 1 : 0;
      if (late_id == 0) {
        late_id = bus.subscribe<gsc::RconConnected>([&late](const gsc::RconConnected&) { ++late; });
      }
    });
    bus.emit(gsc::RconConnected{"127.0.0.1", 27015});
    if (connected != 1 || late != 0) {
      std::cerr << "subscriber added during emit ran in the same emit\n";
      ++failures;
    }
    bus.emit(gsc::RconDisconnected{"test"});
    if (!bus.unsubscribe(id) || bus.unsubscribe(id)) {
      std::cerr << "unsubscribe did not report correctly\n";
      ++failures;
    }
    bus.emit(gsc::RconConnected{"127.0.0.1", 27015});
    if (connected != 1 || late != 1 || bus.subscriber_count<gsc::RconConnected>() != 1) {
      std::cerr << "event bus delivery counts wrong\n";
      ++failures;
    }
  }

  // Test: operator-facing error messages.
  {
    if (gsc::user_message(gsc::transport_error(ECONNREFUSED, "connect")).find("Cannot connect") != 0) {
      std::cerr << "refused message wrong\n";
      ++failures;
    }
    if (gsc::user_message(gsc::transport_error(ETIMEDOUT, "connect")).find("Connection timed out") != 0) {
      std::cerr << "timeout message wrong\n";
      ++failures;
    }
    if (gsc::user_message(gsc::transport_error(EPIPE, "write")).find("Connection was reset") != 0) {
      std::cerr << "reset message wrong\n";
      ++failures;
    }
    if (gsc::user_message(gsc::make_error(gsc::ErrorKind::Auth, "denied")).find("Authentication failed") != 0) {
      std::cerr << "auth message wrong\n";
      ++failures;
    }
    if (!gsc::is_retryable(gsc::transport_error(ECONNRESET, "x")) ||
        gsc::is_retryable(gsc::make_error(gsc::ErrorKind::Auth, "x"))) {
      std::cerr << "retryable classification wrong\n";
      ++failures;
    }
    if (gsc::user_message(gsc::make_error(gsc::ErrorKind::ServerStarting, {})) != "Server is starting, please wait..." ||
        std::string(gsc::error_kind_name(gsc::ErrorKind::Auth)) != "auth") {
      std::cerr << "server-starting message or kind name wrong\n";
      ++failures;
    }
  }

  // Test: log throttle lets one line through per cooldown.
  {
    gsc::log::Throttle throttle(milliseconds(60000));
    const auto t0 = std::chrono::steady_clock::time_point{} + std::chrono::hours(1);
    const bool first = throttle.allow(t0);
    const bool second = throttle.allow(t0 + milliseconds(1000));
    const bool third = throttle.allow(t0 + milliseconds(61000));
    if (!first || second || !third) {
      std::cerr << "throttle cooldown wrong\n";
      ++failures;
    }
    gsc::log::Level level = gsc::log::Level::Info;
    if (!gsc::log::parse_level("debug", level) || level != gsc::log::Level::Debug ||
        gsc::log::parse_level("verbose", level)) {
      std::cerr << "log level parsing wrong\n";
      ++failures;
    }
  }

  // Test: YAML config sections and env overrides.
  {
    const fs::path path = temp_root / "gsc.yaml";
    write_text(path,
               "server:\n"
               "  name: alpha\n"
               "  rcon_port: 27100\n"
               "  launch_command: [\"/srv/start.sh\", \"-servername\", \"alpha\"]\n"
               "rcon:\n"
               "  command_timeout_ms: 2500\n"
               "bridge:\n"
               "  status_stale_ms: 30000\n"
               "restart:\n"
               "  rcon_wait_schedule_ms: [1000, 2000]\n"
               "log:\n"
               "  level: debug\n");
    auto cfg = gsc::load_control_config(path);
    if (cfg.server.name != "alpha" || cfg.server.rcon_port != 27100 || cfg.server.launch_command.size() != 3) {
      std::cerr << "yaml server section not applied\n";
      ++failures;
    }
    if (cfg.rcon.command_timeout_ms != 2500 || cfg.rcon.connect_timeout_ms != 10000) {
      std::cerr << "yaml rcon section not applied\n";
      ++failures;
    }
    if (cfg.bridge.status_stale_ms != 30000 || cfg.restart.rcon_wait_schedule_ms.size() != 2 ||
        cfg.log_level != "debug") {
      std::cerr << "yaml bridge/restart/log sections not applied\n";
      ++failures;
    }

    ::setenv("RCON_HOST", "10.0.0.5", 1);
    ::setenv("RCON_PORT", "not-a-port", 1);
    ::setenv("RCON_SKIP_SERVER_CHECK", "true", 1);
    gsc::apply_env_overrides(cfg);
    if (cfg.server.host != "10.0.0.5" || cfg.server.rcon_port != 27100 || !cfg.rcon.skip_server_check) {
      std::cerr << "env overrides wrong\n";
      ++failures;
    }
    ::unsetenv("RCON_HOST");
    ::unsetenv("RCON_PORT");
    ::unsetenv("RCON_SKIP_SERVER_CHECK");
  }

  // Test: JSON config and fallback to defaults.
  {
    const fs::path path = temp_root / "gsc.json";
    write_text(path, R"({"server":{"host":"192.168.1.2"},"bridge":{"poll_interval_ms":500}})");
    const auto cfg = gsc::load_control_config(path);
    if (cfg.server.host != "192.168.1.2" || cfg.bridge.poll_interval_ms != 500) {
      std::cerr << "json config not applied\n";
      ++failures;
    }
    const fs::path broken = temp_root / "broken.json";
    write_text(broken, "{ not json");
    const auto fallback = gsc::load_control_config(broken);
    if (fallback.server.host != "127.0.0.1" || fallback.bridge.poll_interval_ms != 300) {
      std::cerr << "broken config did not fall back to defaults\n";
      ++failures;
    }
    const auto missing = gsc::load_control_config(temp_root / "nope.yaml");
    if (missing.restart.warning_minutes != 5) {
      std::cerr << "missing config did not yield defaults\n";
      ++failures;
    }
  }

  // Test: atomic write replaces content and leaves no temp file.
  {
    const fs::path path = temp_root / "atomic" / "commands.json";
    fs::create_directories(path.parent_path());
    std::string error;
    if (!gsc::io::write_text_file_atomic(path, R"({"commands":[1]})", error) ||
        !gsc::io::write_text_file_atomic(path, R"({"commands":[1,2]})", error)) {
      std::cerr << "atomic write failed: " << error << "\n";
      ++failures;
    }
    json doc;
    if (!gsc::io::load_json_file(path, doc, error) || doc["commands"].size() != 2) {
      std::cerr << "atomic write content wrong\n";
      ++failures;
    }
    size_t files = 0;
    for (const auto& entry : fs::directory_iterator(path.parent_path())) {
      (void)entry;
      ++files;
    }
    if (files != 1) {
      std::cerr << "atomic write left temp files\n";
      ++failures;
    }
    write_text(temp_root / "atomic" / "empty.json", "   \n");
    if (gsc::io::load_json_file(temp_root / "atomic" / "empty.json", doc, error)) {
      std::cerr << "empty json file should fail to load\n";
      ++failures;
    }
  }

  gsc::log::shutdown();
  fs::remove_all(temp_root, ec);
  if (failures == 0) {
    std::cout << "gsc_core_tests: all passed\n";
  }
  return failures == 0 ? 0 : 1;
}
