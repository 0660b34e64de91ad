#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace gsc {

struct ServerConfig {
  std::string name = "servertest";
  std::string host = "127.0.0.1";
  uint16_t rcon_port = 27015;
  std::string rcon_password;
  std::filesystem::path install_path;
  std::filesystem::path data_path;
  // Explicit bridge directory; empty means discover from name/data/install paths.
  std::filesystem::path bridge_path;
  std::vector<std::string> launch_command;
  std::filesystem::path launch_cwd;
  std::string process_match;
};

struct RconSettings {
  int connect_timeout_ms = 10000;
  int command_timeout_ms = 5000;
  int reconnect_base_delay_ms = 5000;
  int reconnect_max_delay_ms = 30000;
  int max_reconnect_attempts = 30;
  int health_check_interval_ms = 60000;
  int max_health_failures = 3;
  int auto_reconnect_interval_ms = 60000;
  int server_starting_failsafe_ms = 300000;
  int error_log_cooldown_ms = 60000;
  int server_check_timeout_ms = 5000;
  int multi_packet_quiet_ms = 100;
  bool skip_server_check = false;
};

struct BridgeSettings {
  int poll_interval_ms = 300;
  int status_check_interval_ms = 1000;
  int command_timeout_ms = 15000;
  int status_stale_ms = 45000;
  int debounce_ms = 100;
  int max_consecutive_failures = 5;
  int watcher_retry_delay_ms = 5000;
  int max_watcher_retries = 3;
  size_t processed_capacity = 100;
  size_t processed_trim = 50;
};

struct RestartSettings {
  int warning_minutes = 5;
  int minute_interval_ms = 60000;
  int last_minute_wait_ms = 30000;
  int final_warning_wait_ms = 25000;
  int now_wait_ms = 5000;
  int immediate_now_wait_ms = 2000;
  // Bounds on the players probe, save and quit, including any reconnect they trigger.
  int verify_timeout_ms = 15000;
  int save_timeout_ms = 15000;
  int quit_timeout_ms = 15000;
  int save_wait_ms = 3000;
  int quit_wait_ms = 10000;
  // quit_wait_ms plus attempts * interval keeps death confirmation within 60s of quit.
  int death_poll_attempts = 50;
  int death_poll_interval_ms = 1000;
  int kill_wait_ms = 5000;
  int alive_poll_attempts = 60;
  int alive_poll_interval_ms = 1000;
  std::vector<int> rcon_wait_schedule_ms = {60000, 45000, 45000, 45000, 45000};
  int rcon_attempt_timeout_ms = 15000;
  int mod_update_warning_minutes = 5;
};

struct ControlConfig {
  ServerConfig server;
  RconSettings rcon;
  BridgeSettings bridge;
  RestartSettings restart;
  std::string log_level = "info";
};

// Reads YAML or JSON by extension. Missing or unreadable files yield defaults with a warning.
ControlConfig load_control_config(const std::filesystem::path& path);

// RCON_HOST, RCON_PORT, RCON_PASSWORD, RCON_SKIP_SERVER_CHECK.
void apply_env_overrides(ControlConfig& cfg);

} // namespace gsc
