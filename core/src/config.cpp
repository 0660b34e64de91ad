#include "gsc/config.h"

#include "gsc/log.h"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>

namespace gsc {

namespace {
bool file_exists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

// JSON accessors.
nlohmann::json child(const nlohmann::json& node, const char* key) {
  if (node.is_object() && node.contains(key)) {
    return node.at(key);
  }
  return nlohmann::json();
}

bool has(const nlohmann::json& node, const char* key) {
  return node.is_object() && node.contains(key) && !node.at(key).is_null();
}

template <typename T>
void get_if(const nlohmann::json& node, const char* key, T& out) {
  if (has(node, key)) out = node.at(key).get<T>();
}

void get_if(const nlohmann::json& node, const char* key, std::filesystem::path& out) {
  if (has(node, key)) out = node.at(key).get<std::string>();
}

// YAML accessors.
YAML::Node child(const YAML::Node& node, const char* key) {
  if (node.IsMap() && node[key]) {
    return node[key];
  }
  return YAML::Node();
}

template <typename T>
void get_if(const YAML::Node& node, const char* key, T& out) {
  if (node.IsMap() && node[key] && !node[key].IsNull()) out = node[key].as<T>();
}

void get_if(const YAML::Node& node, const char* key, std::filesystem::path& out) {
  if (node.IsMap() && node[key] && !node[key].IsNull()) out = node[key].as<std::string>();
}

template <typename Node>
void apply_sections(const Node& root, ControlConfig& cfg) {
  const Node server = child(root, "server");
  get_if(server, "name", cfg.server.name);
  get_if(server, "host", cfg.server.host);
  int port = cfg.server.rcon_port;
  get_if(server, "rcon_port", port);
  if (port > 0 && port <= 65535) {
    cfg.server.rcon_port = static_cast<uint16_t>(port);
  } else {
    log::warn("config: rcon_port out of range; keeping " + std::to_string(cfg.server.rcon_port));
  }
  get_if(server, "rcon_password", cfg.server.rcon_password);
  get_if(server, "install_path", cfg.server.install_path);
  get_if(server, "data_path", cfg.server.data_path);
  get_if(server, "bridge_path", cfg.server.bridge_path);
  get_if(server, "launch_command", cfg.server.launch_command);
  get_if(server, "launch_cwd", cfg.server.launch_cwd);
  get_if(server, "process_match", cfg.server.process_match);

  const Node rcon = child(root, "rcon");
  get_if(rcon, "connect_timeout_ms", cfg.rcon.connect_timeout_ms);
  get_if(rcon, "command_timeout_ms", cfg.rcon.command_timeout_ms);
  get_if(rcon, "reconnect_base_delay_ms", cfg.rcon.reconnect_base_delay_ms);
  get_if(rcon, "reconnect_max_delay_ms", cfg.rcon.reconnect_max_delay_ms);
  get_if(rcon, "max_reconnect_attempts", cfg.rcon.max_reconnect_attempts);
  get_if(rcon, "health_check_interval_ms", cfg.rcon.health_check_interval_ms);
  get_if(rcon, "max_health_failures", cfg.rcon.max_health_failures);
  get_if(rcon, "auto_reconnect_interval_ms", cfg.rcon.auto_reconnect_interval_ms);
  get_if(rcon, "server_starting_failsafe_ms", cfg.rcon.server_starting_failsafe_ms);
  get_if(rcon, "error_log_cooldown_ms", cfg.rcon.error_log_cooldown_ms);
  get_if(rcon, "server_check_timeout_ms", cfg.rcon.server_check_timeout_ms);
  get_if(rcon, "multi_packet_quiet_ms", cfg.rcon.multi_packet_quiet_ms);
  get_if(rcon, "skip_server_check", cfg.rcon.skip_server_check);

  const Node bridge = child(root, "bridge");
  get_if(bridge, "poll_interval_ms", cfg.bridge.poll_interval_ms);
  get_if(bridge, "status_check_interval_ms", cfg.bridge.status_check_interval_ms);
  get_if(bridge, "command_timeout_ms", cfg.bridge.command_timeout_ms);
  get_if(bridge, "status_stale_ms", cfg.bridge.status_stale_ms);
  get_if(bridge, "debounce_ms", cfg.bridge.debounce_ms);
  get_if(bridge, "max_consecutive_failures", cfg.bridge.max_consecutive_failures);
  get_if(bridge, "watcher_retry_delay_ms", cfg.bridge.watcher_retry_delay_ms);
  get_if(bridge, "max_watcher_retries", cfg.bridge.max_watcher_retries);
  get_if(bridge, "processed_capacity", cfg.bridge.processed_capacity);
  get_if(bridge, "processed_trim", cfg.bridge.processed_trim);

  const Node restart = child(root, "restart");
  get_if(restart, "warning_minutes", cfg.restart.warning_minutes);
  get_if(restart, "minute_interval_ms", cfg.restart.minute_interval_ms);
  get_if(restart, "last_minute_wait_ms", cfg.restart.last_minute_wait_ms);
  get_if(restart, "final_warning_wait_ms", cfg.restart.final_warning_wait_ms);
  get_if(restart, "now_wait_ms", cfg.restart.now_wait_ms);
  get_if(restart, "immediate_now_wait_ms", cfg.restart.immediate_now_wait_ms);
  get_if(restart, "verify_timeout_ms", cfg.restart.verify_timeout_ms);
  get_if(restart, "save_timeout_ms", cfg.restart.save_timeout_ms);
  get_if(restart, "quit_timeout_ms", cfg.restart.quit_timeout_ms);
  get_if(restart, "save_wait_ms", cfg.restart.save_wait_ms);
  get_if(restart, "quit_wait_ms", cfg.restart.quit_wait_ms);
  get_if(restart, "death_poll_attempts", cfg.restart.death_poll_attempts);
  get_if(restart, "death_poll_interval_ms", cfg.restart.death_poll_interval_ms);
  get_if(restart, "kill_wait_ms", cfg.restart.kill_wait_ms);
  get_if(restart, "alive_poll_attempts", cfg.restart.alive_poll_attempts);
  get_if(restart, "alive_poll_interval_ms", cfg.restart.alive_poll_interval_ms);
  get_if(restart, "rcon_wait_schedule_ms", cfg.restart.rcon_wait_schedule_ms);
  get_if(restart, "rcon_attempt_timeout_ms", cfg.restart.rcon_attempt_timeout_ms);
  get_if(restart, "mod_update_warning_minutes", cfg.restart.mod_update_warning_minutes);

  const Node log_section = child(root, "log");
  get_if(log_section, "level", cfg.log_level);
}

bool env_flag(const char* value) {
  const std::string text(value);
  return text == "1" || text == "true" || text == "yes";
}
} // namespace

ControlConfig load_control_config(const std::filesystem::path& path) {
  ControlConfig cfg;

  if (!file_exists(path)) {
    log::warn(std::string("config not found: ") + path.string());
    return cfg;
  }

  const auto ext = path.extension().string();
  if (ext == ".json") {
    try {
      std::ifstream in(path);
      nlohmann::json j;
      in >> j;
      apply_sections(j, cfg);
    } catch (const std::exception& e) {
      log::warn(std::string("config parse failed (") + path.string() + "): " + e.what() +
                "; using defaults");
      return ControlConfig{};
    }
    return cfg;
  }

  if (ext == ".yaml" || ext == ".yml") {
    try {
      const YAML::Node doc = YAML::LoadFile(path.string());
      apply_sections(doc, cfg);
    } catch (const std::exception& e) {
      log::warn(std::string("config parse failed (") + path.string() + "): " + e.what() +
                "; using defaults");
      return ControlConfig{};
    }
    return cfg;
  }

  log::warn("Unknown config extension; using defaults.");
  return cfg;
}

void apply_env_overrides(ControlConfig& cfg) {
  if (const char* host = std::getenv("RCON_HOST")) {
    cfg.server.host = host;
  }
  if (const char* port = std::getenv("RCON_PORT")) {
    char* end = nullptr;
    const long value = std::strtol(port, &end, 10);
    if (end != port && *end == '\0' && value > 0 && value <= 65535) {
      cfg.server.rcon_port = static_cast<uint16_t>(value);
    } else {
      log::warn(std::string("ignoring invalid RCON_PORT: ") + port);
    }
  }
  if (const char* password = std::getenv("RCON_PASSWORD")) {
    cfg.server.rcon_password = password;
  }
  if (const char* skip = std::getenv("RCON_SKIP_SERVER_CHECK")) {
    cfg.rcon.skip_server_check = env_flag(skip);
  }
}

} // namespace gsc
