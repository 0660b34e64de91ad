#include "gsc/event_bus.h"
#include "gsc/event_loop.h"
#include "gsc/events.h"
#include "gsc/file_io.h"
#include "gsc/log.h"
#include "gsc_bridge/bridge_locator.h"
#include "gsc_bridge/command_bridge.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <string>
#include <thread>
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

// Writes the file and pins its mtime so consecutive writes are always distinguishable.
void write_status(const fs::path& dir, const json& doc, std::chrono::milliseconds age) {
  const auto path = dir / gsc::bridge::kStatusFile;
  write_text(path, doc.dump());
  std::error_code ec;
  fs::last_write_time(path, fs::file_time_type::clock::now() - age, ec);
}

json read_commands(const fs::path& dir) {
  json doc;
  std::string error;
  if (!gsc::io::load_json_file(dir / gsc::bridge::kCommandsFile, doc, error)) {
    return json();
  }
  return doc;
}

gsc::BridgeSettings fast_settings() {
  gsc::BridgeSettings settings;
  settings.command_timeout_ms = 1000;
  return settings;
}

struct BridgeCounters {
  int status_changes = 0;
  int results = 0;
  std::vector<std::string> joined;
  std::vector<std::string> left;
  bool last_alive = false;
};

void count_events(gsc::EventBus& bus, BridgeCounters& counters) {
  bus.subscribe<gsc::ModStatusChanged>([&counters](const gsc::ModStatusChanged& ev) {
    ++counters.status_changes;
    counters.last_alive = ev.alive;
  });
  bus.subscribe<gsc::BridgeResultReceived>([&counters](const gsc::BridgeResultReceived&) { ++counters.results; });
  bus.subscribe<gsc::PlayerConnected>([&counters](const gsc::PlayerConnected& ev) {
    counters.joined.push_back(ev.name);
  });
  bus.subscribe<gsc::PlayerDisconnected>([&counters](const gsc::PlayerDisconnected& ev) {
    counters.left.push_back(ev.name);
  });
}
} // namespace

int main() {
  const fs::path temp_root = fs::temp_directory_path() / "gsc_bridge_test";
  std::error_code ec;
  fs::remove_all(temp_root, ec);
  fs::create_directories(temp_root);
  gsc::log::init("gsc_bridge_tests", temp_root);

  int failures = 0;

  // Test: configure and lifecycle preconditions.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    gsc::EventBus bus;
    gsc::bridge::CommandBridge bridge(loop, bus, fast_settings());
    std::string error;
    if (bridge.start(error) || error != "Bridge not configured. Call configure() first.") {
      std::cerr << "start without configure should fail\n";
      ++failures;
    }
    if (bridge.configure(fs::path(), false, error)) {
      std::cerr << "empty bridge path should be rejected\n";
      ++failures;
    }
    auto early = bridge.send_command("ping");
    if (!early.ready() || early.outcome().error.kind != gsc::ErrorKind::NotConfigured) {
      std::cerr << "send before configure should fail fast\n";
      ++failures;
    }
    if (!bridge.configure(temp_root / "lifecycle", false, error) ||
        bridge.bridge_path() != temp_root / "lifecycle" / "panelbridge" || !fs::is_directory(bridge.bridge_path())) {
      std::cerr << "configure did not create folder/panelbridge\n";
      ++failures;
    }
    auto stopped = bridge.send_command("ping");
    if (!stopped.ready() || stopped.outcome().error.message != "Bridge not running") {
      std::cerr << "send while stopped should fail fast\n";
      ++failures;
    }
    if (bridge.status().alive || !bridge.status().waiting) {
      std::cerr << "initial status should be waiting\n";
      ++failures;
    }
  }

  // Test: commands queue in order through one writer, and results resolve them once.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    gsc::EventBus bus;
    BridgeCounters counters;
    count_events(bus, counters);
    const fs::path dir = temp_root / "queue";
    gsc::bridge::CommandBridge bridge(loop, bus, fast_settings());
    std::string error;
    bridge.configure(dir, true, error);
    bridge.start(error);

    std::vector<gsc::Future<gsc::bridge::BridgeResult>> futures;
    for (int i = 0; i < 10; ++i) {
      futures.push_back(bridge.send_command("echo", {{"n", i}}));
    }
    loop.run_for(milliseconds(10));
    const json doc = read_commands(dir);
    std::set<std::string> ids;
    bool ordered = doc.contains("commands") && doc["commands"].size() == 10;
    for (size_t i = 0; ordered && i < doc["commands"].size(); ++i) {
      const auto& cmd = doc["commands"][i];
      ordered = cmd["action"] == "echo" && cmd["args"]["n"] == static_cast<int>(i) && cmd.contains("timestamp");
      ids.insert(cmd["id"].get<std::string>());
    }
    if (!ordered || ids.size() != 10 || bridge.pending_count() != 10) {
      std::cerr << "commands.json does not hold the ten commands in order\n";
      ++failures;
    }

    if (ordered) {
      const auto first = doc["commands"][0]["id"].get<std::string>();
      const auto second = doc["commands"][1]["id"].get<std::string>();
      json results;
      results["results"] = json::array();
      results["results"].push_back({{"id", first}, {"success", true}, {"data", {{"pong", true}}}});
      results["results"].push_back({{"id", second}, {"success", false}, {"error", "nope"}});
      results["results"].push_back({{"id", first}, {"success", true}, {"data", {{"pong", false}}}});
      write_text(dir / gsc::bridge::kResultsFile, results.dump());
      bridge.poll_results();
      bridge.poll_results();

      if (!futures[0].ready() || !futures[0].outcome().ok() || futures[0].outcome().value->data["pong"] != true) {
        std::cerr << "first result not delivered\n";
        ++failures;
      }
      if (!futures[1].ready() || futures[1].outcome().ok() ||
          futures[1].outcome().error.kind != gsc::ErrorKind::CommandFailed ||
          futures[1].outcome().error.message != "nope") {
        std::cerr << "failed result not surfaced\n";
        ++failures;
      }
      if (counters.results != 2 || bridge.pending_count() != 8) {
        std::cerr << "duplicate result delivered twice (results=" << counters.results << ")\n";
        ++failures;
      }
    }

    bridge.stop();
    bool all_stopped = true;
    for (size_t i = 2; i < futures.size(); ++i) {
      all_stopped = all_stopped && futures[i].ready() && futures[i].outcome().error.message == "Bridge stopped";
    }
    if (!all_stopped || bridge.pending_count() != 0) {
      std::cerr << "stop did not reject pending commands\n";
      ++failures;
    }
  }

  // Test: unanswered commands time out; partial result files are skipped.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    gsc::EventBus bus;
    const fs::path dir = temp_root / "timeout";
    gsc::bridge::CommandBridge bridge(loop, bus, fast_settings());
    std::string error;
    bridge.configure(dir, true, error);
    bridge.start(error);
    write_text(dir / gsc::bridge::kResultsFile, "{\"results\": [ {\"id\":");
    auto future = bridge.send_command("getServerInfo");
    loop.run_for(milliseconds(1100));
    if (!future.ready() || future.outcome().error.kind != gsc::ErrorKind::BridgeTimeout ||
        future.outcome().error.message != "Command timeout: getServerInfo (no response from mod)") {
      std::cerr << "command did not time out\n";
      ++failures;
    }
    if (bridge.pending_count() != 0) {
      std::cerr << "timed out command still pending\n";
      ++failures;
    }
  }

  // Test: a malformed commands.json is replaced by a fresh document.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    gsc::EventBus bus;
    const fs::path dir = temp_root / "malformed";
    write_text(dir / gsc::bridge::kCommandsFile, "this is not json");
    gsc::bridge::CommandBridge bridge(loop, bus, fast_settings());
    std::string error;
    bridge.configure(dir, true, error);
    bridge.start(error);
    bridge.save_world();
    loop.run_for(milliseconds(5));
    const json doc = read_commands(dir);
    if (!doc.contains("commands") || doc["commands"].size() != 1 || doc["commands"][0]["action"] != "saveWorld") {
      std::cerr << "malformed commands.json was not replaced\n";
      ++failures;
    }
    bridge.stop();
  }

  // Test: heartbeat, player diffing and failure-count staleness.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    gsc::EventBus bus;
    BridgeCounters counters;
    count_events(bus, counters);
    const fs::path dir = temp_root / "status";
    gsc::bridge::CommandBridge bridge(loop, bus, fast_settings());
    std::string error;
    bridge.configure(dir, true, error);
    bridge.start(error);

    auto refused = bridge.ping();
    if (!refused.ready() || refused.outcome().error.kind != gsc::ErrorKind::BridgeStale) {
      std::cerr << "ping should refuse while the mod is not connected\n";
      ++failures;
    }

    write_status(dir, {{"version", "1.4"}, {"serverName", "alpha"}, {"playerCount", 2},
                       {"players", {"ann", "bob"}}, {"timestamp", 1700000000}},
                 std::chrono::seconds(3));
    bridge.check_mod_status();
    const auto& status = bridge.status();
    if (!status.alive || status.waiting || status.version != std::optional<std::string>("1.4") ||
        status.player_count != std::optional<int>(2) || !counters.last_alive) {
      std::cerr << "fresh heartbeat not reported alive\n";
      ++failures;
    }
    if (counters.joined != std::vector<std::string>{"ann", "bob"}) {
      std::cerr << "initial players not reported as connected\n";
      ++failures;
    }

    const int changes_before = counters.status_changes;
    bridge.check_mod_status();
    if (counters.status_changes != changes_before) {
      std::cerr << "unchanged heartbeat emitted a status change\n";
      ++failures;
    }

    write_status(dir, {{"version", "1.4"}, {"serverName", "alpha"}, {"playerCount", 2},
                       {"players", {"bob", "cid"}}, {"timestamp", 1700000005}},
                 std::chrono::seconds(2));
    bridge.check_mod_status();
    if (counters.joined.back() != "cid" || counters.left != std::vector<std::string>{"ann"}) {
      std::cerr << "player diff wrong\n";
      ++failures;
    }

    if (bridge.ping().ready()) {
      std::cerr << "ping to a live mod should wait for a result\n";
      ++failures;
    }

    fs::remove(dir / gsc::bridge::kStatusFile, ec);
    for (int i = 0; i < 4; ++i) {
      bridge.check_mod_status();
    }
    if (!bridge.status().alive) {
      std::cerr << "status flipped before the failure threshold\n";
      ++failures;
    }
    bridge.check_mod_status();
    const auto& dead = bridge.status();
    if (dead.alive || dead.version != std::optional<std::string>("1.4") ||
        dead.server_name != std::optional<std::string>("alpha") || dead.player_count.has_value() ||
        !dead.players.empty() || dead.error != "Status file does not exist" || counters.last_alive) {
      std::cerr << "failure threshold did not mark the mod disconnected with metadata preserved\n";
      ++failures;
    }

    write_status(dir, {{"version", "1.4"}, {"serverName", "alpha"}, {"playerCount", 0}, {"players", json::array()}},
                 std::chrono::seconds(60));
    bridge.check_mod_status();
    if (bridge.status().alive || bridge.status().waiting) {
      std::cerr << "stale heartbeat should not count as alive\n";
      ++failures;
    }

    const json diag = bridge.get_status().to_json();
    if (!diag["configured"].get<bool>() || !diag["isRunning"].get<bool>() || !diag["statusFile"]["exists"].get<bool>() ||
        diag["statusFile"]["ageSeconds"].get<int64_t>() < 59 || diag["config"]["statusStaleMs"] != 45000) {
      std::cerr << "diagnostics incomplete: " << diag.dump() << "\n";
      ++failures;
    }
    bridge.stop();
  }

  // Test: a heartbeat file that stops changing goes stale on the next check.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    gsc::EventBus bus;
    BridgeCounters counters;
    count_events(bus, counters);
    const fs::path dir = temp_root / "stale_heartbeat";
    gsc::bridge::CommandBridge bridge(loop, bus, fast_settings());
    std::string error;
    bridge.configure(dir, true, error);
    bridge.start(error);

    // Just under the 45s threshold; the file itself is never touched again.
    write_status(dir, {{"version", "2.0"}, {"serverName", "beta"}, {"playerCount", 1}, {"players", {"ann"}}},
                 std::chrono::milliseconds(44600));
    bridge.check_mod_status();
    if (!bridge.status().alive) {
      std::cerr << "fresh heartbeat not alive\n";
      ++failures;
    }
    const int changes_before = counters.status_changes;
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    bridge.check_mod_status();
    const auto& stale = bridge.status();
    if (stale.alive || stale.version != std::optional<std::string>("2.0") ||
        stale.server_name != std::optional<std::string>("beta") || stale.age_ms < 45000) {
      std::cerr << "unchanged heartbeat did not go stale with metadata preserved\n";
      ++failures;
    }
    if (counters.status_changes != changes_before + 1 || counters.last_alive) {
      std::cerr << "stale transition should emit exactly one disconnected status\n";
      ++failures;
    }
    bridge.check_mod_status();
    if (counters.status_changes != changes_before + 1) {
      std::cerr << "stale status re-emitted on every check\n";
      ++failures;
    }
    bridge.stop();
  }

  // Test: the result poll sweeps pending commands older than twice the timeout.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    gsc::EventBus bus;
    const fs::path dir = temp_root / "sweep";
    gsc::bridge::CommandBridge bridge(loop, bus, fast_settings());
    std::string error;
    bridge.configure(dir, true, error);
    bridge.start(error);

    auto lost = bridge.send_command("getServerInfo");
    auto also_lost = bridge.send_command("ping");
    // Advance the clock without running timers, as if the loop had been starved.
    clock.advance(milliseconds(2500));
    auto fresh = bridge.send_command("saveWorld");
    bridge.poll_results();
    if (!lost.ready() || lost.outcome().ok() || lost.outcome().error.kind != gsc::ErrorKind::BridgeTimeout ||
        lost.outcome().error.message != "Command timeout: getServerInfo (stale pending command)") {
      std::cerr << "stale pending command not swept\n";
      ++failures;
    }
    if (!also_lost.ready() || fresh.ready() || bridge.pending_count() != 1) {
      std::cerr << "sweep should only clear commands past twice the timeout\n";
      ++failures;
    }
    bridge.stop();
  }

  // Test: the poll timers pick up results without explicit calls.
  {
    gsc::ManualClock clock;
    gsc::EventLoop loop(clock);
    gsc::EventBus bus;
    const fs::path dir = temp_root / "timers";
    gsc::bridge::CommandBridge bridge(loop, bus, fast_settings());
    std::string error;
    bridge.configure(dir, true, error);
    bridge.start(error);
    auto future = bridge.send_server_message("hello", "red");
    loop.run_for(milliseconds(5));
    const json doc = read_commands(dir);
    if (doc.contains("commands") && doc["commands"].size() == 1) {
      const auto& cmd = doc["commands"][0];
      if (cmd["args"]["message"] != "hello" || cmd["args"]["color"] != "red") {
        std::cerr << "sendServerMessage args wrong\n";
        ++failures;
      }
      json results;
      results["results"] = json::array({{{"id", cmd["id"]}, {"success", true}, {"data", {{"sent", true}}}}});
      write_text(dir / gsc::bridge::kResultsFile, results.dump());
    }
    loop.run_until([&future] { return future.ready(); }, milliseconds(900));
    if (!future.ready() || !future.outcome().ok()) {
      std::cerr << "poll timer did not deliver the result\n";
      ++failures;
    }
    bridge.stop();
  }

  // Test: bridge directory discovery order.
  {
    const fs::path base = temp_root / "locate";
    const fs::path install = base / "servers" / "pz";
    const fs::path data = base / "Zomboid";
    fs::create_directories(install);
    fs::create_directories(base / "servers" / "Server_files_b");
    fs::create_directories(base / "servers" / "Server_files_a");

    auto location = gsc::bridge::locate_bridge_dir("alpha", data, install);
    if (location.candidates.size() != 4 || location.exists ||
        location.path != base / "servers" / "Server_files_a" / "Lua" / "panelbridge" / "alpha") {
      std::cerr << "expected path should prefer the first Server_files candidate\n";
      ++failures;
    }

    const fs::path install_dir = install / "Lua" / "panelbridge" / "alpha";
    fs::create_directories(install_dir);
    location = gsc::bridge::locate_bridge_dir("alpha", data, install);
    if (location.path != install_dir || !location.exists || location.has_status) {
      std::cerr << "existing directory should be chosen when nothing is initialized\n";
      ++failures;
    }

    const fs::path data_dir = data / "Lua" / "panelbridge" / "alpha";
    write_text(data_dir / ".init", "");
    location = gsc::bridge::locate_bridge_dir("alpha", data, install);
    if (location.path != data_dir || !location.has_init) {
      std::cerr << "initialized directory should win over a bare one\n";
      ++failures;
    }

    write_text(install_dir / gsc::bridge::kStatusFile, "{}");
    location = gsc::bridge::locate_bridge_dir("alpha", data, install);
    if (location.path != install_dir || !location.has_status) {
      std::cerr << "directory with a heartbeat should win\n";
      ++failures;
    }
  }

  gsc::log::shutdown();
  fs::remove_all(temp_root, ec);
  if (failures == 0) {
    std::cout << "gsc_bridge_tests: all passed\n";
  }
  return failures == 0 ? 0 : 1;
}
