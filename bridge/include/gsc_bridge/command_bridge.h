#pragma once

#include "gsc/config.h"
#include "gsc/event_bus.h"
#include "gsc/event_loop.h"
#include "gsc/future.h"
#include "gsc_platform/file_watcher.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace gsc::bridge {

constexpr const char* kCommandsFile = "commands.json";
constexpr const char* kResultsFile = "results.json";
constexpr const char* kStatusFile = "status.json";

struct BridgeStatus {
  bool alive = false;
  // True until the first status file has been read.
  bool waiting = true;
  std::optional<std::string> version;
  std::optional<std::string> server_name;
  std::optional<int> player_count;
  std::vector<std::string> players;
  std::optional<int64_t> timestamp;
  int64_t age_ms = 0;
  int consecutive_failures = 0;
  std::string error;

  nlohmann::json to_json() const;
};

struct BridgeResult {
  nlohmann::json data;
};

struct StatusFileInfo {
  bool exists = false;
  std::string path;
  uintmax_t size = 0;
  int64_t age_ms = 0;
  std::string error;
};

struct BridgeDiagnostics {
  bool configured = false;
  std::string bridge_path;
  bool running = false;
  size_t pending_commands = 0;
  BridgeStatus status;
  int consecutive_failures = 0;
  BridgeSettings config;
  StatusFileInfo status_file;
  bool watcher_active = false;
  std::string watcher_backend;

  nlohmann::json to_json() const;
};

// Asynchronous command/result/status channel over three JSON files shared with
// the in-game script. The control plane is the only writer of commands.json;
// the script is the only writer of results.json and status.json.
class CommandBridge {
 public:
  CommandBridge(EventLoop& loop, EventBus& bus, BridgeSettings settings,
                platform::FileWatcher::Backend watcher_backend = platform::FileWatcher::Backend::Native);
  ~CommandBridge();

  CommandBridge(const CommandBridge&) = delete;
  CommandBridge& operator=(const CommandBridge&) = delete;

  // The bridge directory is folder/panelbridge, or folder itself when is_direct_path.
  bool configure(const std::filesystem::path& folder, bool is_direct_path, std::string& error);
  bool start(std::string& error);
  void stop();

  Future<BridgeResult> send_command(const std::string& action,
                                    const nlohmann::json& args = nlohmann::json::object());

  Future<BridgeResult> ping();
  Future<BridgeResult> get_server_info();
  Future<BridgeResult> save_world();
  Future<BridgeResult> send_server_message(const std::string& message,
                                           const std::string& color = "white");

  // One pass each; also driven by the poll timers and the file watcher.
  void poll_results();
  void check_mod_status();

  const BridgeStatus& status() const { return status_; }
  BridgeDiagnostics get_status() const;
  bool is_mod_connected() const { return status_.alive; }
  bool running() const { return running_; }
  bool configured() const { return !bridge_path_.empty(); }
  const std::filesystem::path& bridge_path() const { return bridge_path_; }
  size_t pending_count() const { return pending_.size(); }
  bool watcher_active() const;

 private:
  struct PendingCommand {
    std::string action;
    Clock::time_point issued_at;
    TimerId timeout_timer = kInvalidTimer;
    Promise<BridgeResult> promise;
  };

  struct QueuedCommand {
    std::string id;
    nlohmann::json entry;
  };

  std::filesystem::path file_path(const char* name) const { return bridge_path_ / name; }
  std::string next_command_id();

  void flush_write_queue();
  void on_command_timeout(const std::string& id);
  void sweep_stale_pending();
  void remember_processed(const std::string& id);

  void handle_status_failure(const std::string& reason);
  void track_player_activity(const std::vector<std::string>& players);

  void setup_watcher();
  void schedule_watcher_retry();
  void teardown_watcher();
  void on_watcher_ready(uint32_t events);
  void on_debounce();

  EventLoop& loop_;
  EventBus& bus_;
  BridgeSettings settings_;
  platform::FileWatcher::Backend watcher_backend_;

  std::filesystem::path bridge_path_;
  bool running_ = false;

  std::unordered_map<std::string, PendingCommand> pending_;
  std::deque<QueuedCommand> write_queue_;
  TimerId flush_timer_ = kInvalidTimer;

  std::deque<std::string> processed_order_;
  std::unordered_set<std::string> processed_ids_;

  BridgeStatus status_;
  bool have_status_ = false;
  bool was_alive_ = false;
  std::optional<std::filesystem::file_time_type> last_status_mtime_;
  int consecutive_failures_ = 0;
  std::unordered_set<std::string> previous_players_;

  TimerId poll_timer_ = kInvalidTimer;
  TimerId status_timer_ = kInvalidTimer;
  TimerId debounce_timer_ = kInvalidTimer;
  TimerId watcher_retry_timer_ = kInvalidTimer;
  std::unique_ptr<platform::FileWatcher> watcher_;
  int watched_fd_ = -1;
  int watcher_retries_ = 0;
  bool dirty_status_ = false;
  bool dirty_results_ = false;

  uint64_t id_counter_ = 0;
  uint64_t id_salt_ = 0;
};

} // namespace gsc::bridge
