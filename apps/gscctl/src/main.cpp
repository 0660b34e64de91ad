#include "gsc/config.h"
#include "gsc/event_bus.h"
#include "gsc/event_loop.h"
#include "gsc/events.h"
#include "gsc/log.h"
#include "gsc/paths.h"
#include "gsc_control/control_plane.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) {
  g_stop_requested = 1;
}

struct CliOptions {
  std::optional<fs::path> config_path;
  std::string log_level;
  int warning_minutes = -1;
  std::string args_json;
  bool json_output = false;
};

void print_usage() {
  std::cout << "Usage:\n"
            << "  gscctl run [--config <file>] [--log-level <level>]\n"
            << "  gscctl rcon exec \"<command>\" [--config <file>]\n"
            << "  gscctl rcon players [--config <file>]\n"
            << "  gscctl rcon message \"<text>\" [--config <file>]\n"
            << "  gscctl bridge send <action> [--args <json>] [--config <file>]\n"
            << "  gscctl bridge ping [--config <file>]\n"
            << "  gscctl bridge status [--json] [--config <file>]\n"
            << "  gscctl restart [--warning-minutes <n>] [--config <file>]\n";
}

template <typename T>
bool wait_for(gsc::EventLoop& loop, const gsc::Future<T>& future, std::chrono::milliseconds limit) {
  return loop.run_until([&future] { return future.ready() || g_stop_requested != 0; }, limit) &&
         future.ready();
}

gsc::ControlConfig load_config(const char* argv0, const CliOptions& opts) {
  const auto paths = gsc::resolve_paths(argv0, opts.config_path);
  gsc::log::init("gscctl", paths.root);
  auto cfg = gsc::load_control_config(paths.config_file);
  gsc::apply_env_overrides(cfg);

  const std::string level_text = opts.log_level.empty() ? cfg.log_level : opts.log_level;
  gsc::log::Level level = gsc::log::Level::Info;
  if (gsc::log::parse_level(level_text, level)) {
    gsc::log::set_level(level);
  } else {
    gsc::log::warn("unknown log level '" + level_text + "', using info");
  }
  return cfg;
}

int cmd_run(const char* argv0, const CliOptions& opts) {
  const auto cfg = load_config(argv0, opts);
  gsc::log::install_crash_handlers();
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  gsc::EventLoop loop;
  gsc::EventBus bus;
  gsc::control::ControlPlane plane(loop, bus, cfg);
  std::string error;
  if (!plane.start(error)) {
    gsc::log::error("gscctl run: " + error);
    gsc::log::shutdown();
    return 1;
  }

  loop.call_every(std::chrono::milliseconds(200), [&loop] {
    if (g_stop_requested != 0) {
      loop.stop();
    }
  });
  loop.run();

  gsc::log::info("gscctl run: shutting down");
  plane.stop();
  gsc::log::shutdown();
  return 0;
}

int cmd_rcon(const char* argv0, const std::string& sub, const std::string& text, const CliOptions& opts) {
  const auto cfg = load_config(argv0, opts);
  gsc::EventLoop loop;
  gsc::EventBus bus;
  gsc::control::ControlPlane plane(loop, bus, cfg);
  auto& session = plane.session();
  const auto limit = std::chrono::milliseconds(cfg.rcon.connect_timeout_ms + cfg.rcon.command_timeout_ms * 3 +
                                               cfg.rcon.reconnect_max_delay_ms);

  if (sub == "players") {
    auto future = session.players();
    if (!wait_for(loop, future, limit) || !future.outcome().ok()) {
      std::cerr << "gscctl: players request did not complete\n";
      return 1;
    }
    const auto& result = *future.outcome().value;
    if (!result.success) {
      std::cerr << "gscctl: " << result.error << "\n";
      return 1;
    }
    std::cout << "Players connected (" << result.players.size() << "):\n";
    for (const auto& name : result.players) {
      std::cout << "  " << name << "\n";
    }
    return 0;
  }

  auto future = sub == "message" ? session.server_message(text) : session.execute(text);
  if (!wait_for(loop, future, limit) || !future.outcome().ok()) {
    std::cerr << "gscctl: command did not complete\n";
    return 1;
  }
  const auto& result = *future.outcome().value;
  if (!result.success) {
    std::cerr << "gscctl: " << result.error << "\n";
    return 1;
  }
  std::cout << result.response << "\n";
  return 0;
}

int cmd_bridge(const char* argv0, const std::string& sub, const std::string& action, const CliOptions& opts) {
  const auto cfg = load_config(argv0, opts);
  gsc::EventLoop loop;
  gsc::EventBus bus;
  gsc::control::ControlPlane plane(loop, bus, cfg);
  auto& bridge = plane.bridge();
  std::string error;
  if (!plane.configure_bridge(error) || !bridge.start(error)) {
    std::cerr << "gscctl: " << error << "\n";
    return 1;
  }

  if (sub == "status") {
    const auto diag = bridge.get_status();
    if (opts.json_output) {
      std::cout << diag.to_json().dump(2) << "\n";
      return 0;
    }
    const auto& status = diag.status;
    std::cout << "bridge: " << diag.bridge_path << "\n"
              << "mod: " << (status.alive ? "connected" : (status.waiting ? "waiting" : "disconnected")) << "\n";
    if (status.version) std::cout << "version: " << *status.version << "\n";
    if (status.server_name) std::cout << "server: " << *status.server_name << "\n";
    if (status.player_count) std::cout << "players: " << *status.player_count << "\n";
    if (diag.status_file.exists) std::cout << "status age: " << diag.status_file.age_ms / 1000 << "s\n";
    if (!status.error.empty()) std::cout << "last error: " << status.error << "\n";
    return status.alive ? 0 : 2;
  }

  json args = json::object();
  if (!opts.args_json.empty()) {
    args = json::parse(opts.args_json, nullptr, false);
    if (args.is_discarded() || !args.is_object()) {
      std::cerr << "gscctl: --args must be a JSON object\n";
      return 1;
    }
  }
  auto future = sub == "ping" ? bridge.ping() : bridge.send_command(action, args);
  const auto limit = std::chrono::milliseconds(cfg.bridge.command_timeout_ms + 1000);
  if (!wait_for(loop, future, limit)) {
    std::cerr << "gscctl: interrupted\n";
    return 1;
  }
  const auto& outcome = future.outcome();
  if (!outcome.ok()) {
    std::cerr << "gscctl: " << outcome.error.message << "\n";
    return 1;
  }
  std::cout << outcome.value->data.dump(2) << "\n";
  return 0;
}

int cmd_restart(const char* argv0, const CliOptions& opts) {
  const auto cfg = load_config(argv0, opts);
  std::signal(SIGINT, handle_stop_signal);
  gsc::EventLoop loop;
  gsc::EventBus bus;
  gsc::control::ControlPlane plane(loop, bus, cfg);
  bus.subscribe<gsc::RestartPhaseChanged>([](const gsc::RestartPhaseChanged& ev) {
    std::cout << "[" << ev.phase << "] " << ev.message << "\n";
  });

  auto& restarts = plane.restarts();
  const int minutes = opts.warning_minutes >= 0 ? opts.warning_minutes : cfg.restart.warning_minutes;
  auto future = restarts.perform_restart(minutes);
  // Ctrl-C during the countdown cancels the restart instead of abandoning it.
  bool cancel_sent = false;
  while (!future.ready()) {
    loop.run_once(std::chrono::milliseconds(200));
    if (g_stop_requested != 0 && !cancel_sent) {
      cancel_sent = true;
      if (!restarts.cancel_restart()) {
        std::cerr << "gscctl: restart can no longer be cancelled\n";
      }
    }
  }
  const auto& outcome = future.outcome();
  if (!outcome.ok()) {
    std::cerr << "gscctl: " << outcome.error.message << "\n";
    return 1;
  }
  const auto& result = *outcome.value;
  std::cout << (result.success ? "ok" : "failed") << ": " << result.message << " (phase " << result.phase
            << ", " << result.duration.count() / 1000 << "s)\n";
  return result.success ? 0 : 1;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    print_usage();
    return 1;
  }
  const char* argv0 = argc > 0 ? argv[0] : nullptr;
  const std::string command = argv[1];

  CliOptions opts;
  std::vector<std::string> positional;
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      opts.config_path = fs::path(argv[++i]);
    } else if (arg == "--log-level" && i + 1 < argc) {
      opts.log_level = argv[++i];
    } else if (arg == "--warning-minutes" && i + 1 < argc) {
      try {
        opts.warning_minutes = std::max(0, std::stoi(argv[++i]));
      } catch (const std::exception&) {
        std::cerr << "gscctl: --warning-minutes expects a number\n";
        return 1;
      }
    } else if (arg == "--args" && i + 1 < argc) {
      opts.args_json = argv[++i];
    } else if (arg == "--json") {
      opts.json_output = true;
    } else {
      positional.push_back(arg);
    }
  }

  if (command == "run") {
    return cmd_run(argv0, opts);
  }
  if (command == "rcon" && !positional.empty()) {
    const std::string& sub = positional[0];
    if (sub == "players") {
      return cmd_rcon(argv0, sub, {}, opts);
    }
    if ((sub == "exec" || sub == "message") && positional.size() >= 2) {
      return cmd_rcon(argv0, sub, positional[1], opts);
    }
  }
  if (command == "bridge" && !positional.empty()) {
    const std::string& sub = positional[0];
    if (sub == "status" || sub == "ping") {
      return cmd_bridge(argv0, sub, {}, opts);
    }
    if (sub == "send" && positional.size() >= 2) {
      return cmd_bridge(argv0, sub, positional[1], opts);
    }
  }
  if (command == "restart") {
    return cmd_restart(argv0, opts);
  }

  print_usage();
  return 1;
}
