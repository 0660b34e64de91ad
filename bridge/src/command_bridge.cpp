#include "gsc_bridge/command_bridge.h"

#include "gsc/events.h"
#include "gsc/file_io.h"
#include "gsc/log.h"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace gsc::bridge {

namespace {
using std::chrono::milliseconds;
using json = nlohmann::json;

int64_t epoch_ms_now() {
  return std::chrono::duration_cast<milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int64_t file_age_ms(std::filesystem::file_time_type mtime) {
  const auto age = std::filesystem::file_time_type::clock::now() - mtime;
  return std::chrono::duration_cast<milliseconds>(age).count();
}

bool is_blank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string id_to_string(const json& value) {
  if (value.is_string()) return value.get<std::string>();
  if (value.is_number()) return value.dump();
  return {};
}

json optional_to_json(const std::optional<std::string>& value) {
  return value ? json(*value) : json();
}

// Compares everything except the age, which changes on every read.
bool same_status(const BridgeStatus& a, const BridgeStatus& b) {
  json ja = a.to_json();
  json jb = b.to_json();
  ja.erase("age");
  jb.erase("age");
  return ja == jb;
}

ModStatusChanged to_event(const BridgeStatus& status) {
  ModStatusChanged ev;
  ev.alive = status.alive;
  ev.version = status.version;
  ev.server_name = status.server_name;
  ev.player_count = status.player_count;
  ev.players = status.players;
  return ev;
}
} // namespace

json BridgeStatus::to_json() const {
  json out;
  out["alive"] = alive;
  out["waiting"] = waiting;
  out["version"] = optional_to_json(version);
  out["serverName"] = optional_to_json(server_name);
  out["playerCount"] = player_count ? json(*player_count) : json();
  out["players"] = players;
  out["timestamp"] = timestamp ? json(*timestamp) : json();
  out["age"] = age_ms;
  out["consecutiveFailures"] = consecutive_failures;
  if (!error.empty()) {
    out["error"] = error;
  }
  return out;
}

json BridgeDiagnostics::to_json() const {
  json out;
  out["configured"] = configured;
  out["bridgePath"] = bridge_path.empty() ? json() : json(bridge_path);
  out["isRunning"] = running;
  out["pendingCommands"] = pending_commands;
  out["modStatus"] = status.to_json();
  out["consecutiveFailures"] = consecutive_failures;
  out["config"] = {{"statusStaleMs", config.status_stale_ms},
                   {"pollIntervalMs", config.poll_interval_ms},
                   {"statusCheckMs", config.status_check_interval_ms},
                   {"commandTimeoutMs", config.command_timeout_ms}};
  json file;
  file["exists"] = status_file.exists;
  file["path"] = status_file.path;
  if (status_file.exists) {
    file["size"] = status_file.size;
    file["age"] = status_file.age_ms;
    file["ageSeconds"] = status_file.age_ms / 1000;
  }
  if (!status_file.error.empty()) {
    file["error"] = status_file.error;
  }
  out["statusFile"] = file;
  out["hasFileWatcher"] = watcher_active;
  out["watcherBackend"] = watcher_backend;
  return out;
}

CommandBridge::CommandBridge(EventLoop& loop, EventBus& bus, BridgeSettings settings,
                             platform::FileWatcher::Backend watcher_backend)
    : loop_(loop), bus_(bus), settings_(settings), watcher_backend_(watcher_backend) {
  std::random_device rd;
  id_salt_ = (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

CommandBridge::~CommandBridge() {
  if (running_) {
    stop();
  }
  teardown_watcher();
  loop_.cancel(flush_timer_);
  loop_.cancel(watcher_retry_timer_);
}

bool CommandBridge::configure(const std::filesystem::path& folder, bool is_direct_path,
                              std::string& error) {
  if (folder.empty()) {
    error = "bridge folder path is required";
    return false;
  }
  const std::filesystem::path target = is_direct_path ? folder : folder / "panelbridge";
  std::error_code ec;
  std::filesystem::create_directories(target, ec);
  if (ec) {
    error = "cannot create bridge directory " + target.string() + ": " + ec.message();
    return false;
  }

  const bool was_running = running_;
  if (was_running) {
    stop();
  }
  bridge_path_ = target;
  have_status_ = false;
  status_ = BridgeStatus{};
  last_status_mtime_.reset();
  previous_players_.clear();
  log::debug("bridge: configured path " + bridge_path_.string());
  if (was_running) {
    return start(error);
  }
  return true;
}

bool CommandBridge::start(std::string& error) {
  if (!configured()) {
    error = "Bridge not configured. Call configure() first.";
    return false;
  }
  if (running_) {
    log::debug("bridge: already running");
    return true;
  }

  consecutive_failures_ = 0;
  last_status_mtime_.reset();
  watcher_retries_ = 0;

  poll_timer_ = loop_.call_every(milliseconds(settings_.poll_interval_ms), [this] { poll_results(); });
  status_timer_ = loop_.call_every(milliseconds(settings_.status_check_interval_ms),
                                   [this] { check_mod_status(); });
  running_ = true;
  setup_watcher();
  check_mod_status();

  log::info("bridge: started - watching " + bridge_path_.string());
  bus_.emit(BridgeStarted{bridge_path_.string()});
  return true;
}

void CommandBridge::stop() {
  loop_.cancel(poll_timer_);
  loop_.cancel(status_timer_);
  loop_.cancel(flush_timer_);
  loop_.cancel(watcher_retry_timer_);
  poll_timer_ = kInvalidTimer;
  status_timer_ = kInvalidTimer;
  flush_timer_ = kInvalidTimer;
  watcher_retry_timer_ = kInvalidTimer;
  teardown_watcher();
  write_queue_.clear();

  auto pending = std::move(pending_);
  pending_.clear();
  for (auto& entry : pending) {
    loop_.cancel(entry.second.timeout_timer);
  }

  const bool was_running = running_;
  running_ = false;
  for (auto& entry : pending) {
    entry.second.promise.reject(make_error(ErrorKind::BridgeStopped, "Bridge stopped"));
  }
  if (was_running) {
    log::info("bridge: stopped");
    bus_.emit(BridgeStopped{});
  }
}

std::string CommandBridge::next_command_id() {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0') << std::setw(16) << id_salt_ << '-' << std::setw(8)
      << ++id_counter_;
  return oss.str();
}

Future<BridgeResult> CommandBridge::send_command(const std::string& action, const json& args) {
  if (!configured()) {
    return make_failed_future<BridgeResult>(make_error(ErrorKind::NotConfigured, "Bridge not configured"));
  }
  if (!running_) {
    return make_failed_future<BridgeResult>(make_error(ErrorKind::BridgeStopped, "Bridge not running"));
  }

  const std::string id = next_command_id();
  json entry;
  entry["id"] = id;
  entry["action"] = action;
  entry["args"] = args.is_null() ? json::object() : args;
  entry["timestamp"] = epoch_ms_now();

  PendingCommand pending;
  pending.action = action;
  pending.issued_at = loop_.now();
  pending.timeout_timer = loop_.call_later(milliseconds(settings_.command_timeout_ms),
                                           [this, id] { on_command_timeout(id); });
  auto future = pending.promise.future();
  pending_.emplace(id, std::move(pending));

  write_queue_.push_back({id, std::move(entry)});
  if (flush_timer_ == kInvalidTimer) {
    flush_timer_ = loop_.call_later(milliseconds(0), [this] {
      flush_timer_ = kInvalidTimer;
      flush_write_queue();
    });
  }
  return future;
}

void CommandBridge::flush_write_queue() {
  if (write_queue_.empty() || !configured()) {
    return;
  }
  auto batch = std::move(write_queue_);
  write_queue_.clear();

  const auto path = file_path(kCommandsFile);
  json doc = {{"commands", json::array()}};
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::string text;
    std::string error;
    if (io::read_text_file(path, text, error) && !is_blank(text)) {
      json existing = json::parse(text, nullptr, false);
      if (existing.is_object()) {
        doc = std::move(existing);
        if (!doc.contains("commands") || !doc["commands"].is_array()) {
          doc["commands"] = json::array();
        }
      } else {
        log::warn("bridge: malformed " + std::string(kCommandsFile) + "; starting a fresh document");
      }
    }
  }

  for (auto& queued : batch) {
    doc["commands"].push_back(std::move(queued.entry));
  }

  std::string error;
  if (io::write_text_file_atomic(path, doc.dump(2), error)) {
    return;
  }
  log::error("bridge: write queue error: " + error);
  for (const auto& queued : batch) {
    auto it = pending_.find(queued.id);
    if (it == pending_.end()) continue;
    PendingCommand failed = std::move(it->second);
    pending_.erase(it);
    loop_.cancel(failed.timeout_timer);
    failed.promise.reject(make_error(ErrorKind::Io, error));
  }
}

void CommandBridge::on_command_timeout(const std::string& id) {
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return;
  }
  PendingCommand expired = std::move(it->second);
  pending_.erase(it);
  expired.promise.reject(make_error(ErrorKind::BridgeTimeout,
                                    "Command timeout: " + expired.action + " (no response from mod)"));
}

void CommandBridge::sweep_stale_pending() {
  const auto now = loop_.now();
  const auto max_age = milliseconds(settings_.command_timeout_ms) * 2;
  std::vector<std::string> stale;
  for (const auto& entry : pending_) {
    if (now - entry.second.issued_at > max_age) {
      stale.push_back(entry.first);
    }
  }
  for (const auto& id : stale) {
    auto it = pending_.find(id);
    if (it == pending_.end()) continue;
    PendingCommand dead = std::move(it->second);
    pending_.erase(it);
    loop_.cancel(dead.timeout_timer);
    const auto age_s = std::chrono::duration_cast<std::chrono::seconds>(now - dead.issued_at).count();
    log::warn("bridge: cleaned up stale pending command: " + dead.action + " (age: " +
              std::to_string(age_s) + "s)");
    dead.promise.reject(make_error(ErrorKind::BridgeTimeout,
                                   "Command timeout: " + dead.action + " (stale pending command)"));
  }
}

void CommandBridge::remember_processed(const std::string& id) {
  processed_order_.push_back(id);
  processed_ids_.insert(id);
  if (processed_order_.size() <= settings_.processed_capacity) {
    return;
  }
  const size_t drop = std::min(settings_.processed_trim, processed_order_.size());
  for (size_t i = 0; i < drop; ++i) {
    processed_ids_.erase(processed_order_.front());
    processed_order_.pop_front();
  }
}

void CommandBridge::poll_results() {
  if (!configured()) {
    return;
  }
  const auto path = file_path(kResultsFile);
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::string text;
    std::string error;
    json doc;
    // Partial writes parse as garbage; the next poll sees the finished file.
    if (io::read_text_file(path, text, error) && !is_blank(text)) {
      doc = json::parse(text, nullptr, false);
    }
    if (doc.is_object() && doc.contains("results") && doc["results"].is_array()) {
      for (const auto& item : doc["results"]) {
        if (!item.is_object() || !item.contains("id")) continue;
        const std::string id = id_to_string(item["id"]);
        if (id.empty() || processed_ids_.count(id) > 0) continue;
        remember_processed(id);

        const bool success = item.value("success", false);
        const json data = item.contains("data") ? item["data"] : json();
        std::string result_error;
        if (item.contains("error") && item["error"].is_string()) {
          result_error = item["error"].get<std::string>();
        }

        auto it = pending_.find(id);
        if (it != pending_.end()) {
          PendingCommand done = std::move(it->second);
          pending_.erase(it);
          loop_.cancel(done.timeout_timer);
          if (success) {
            done.promise.resolve(BridgeResult{data});
          } else {
            done.promise.reject(make_error(ErrorKind::CommandFailed,
                                           result_error.empty() ? "Command failed" : result_error));
          }
        }
        bus_.emit(BridgeResultReceived{id, success, data, result_error});
      }
    }
  }
  sweep_stale_pending();
}

void CommandBridge::check_mod_status() {
  if (!configured()) {
    handle_status_failure("No status file path configured");
    return;
  }
  const auto path = file_path(kStatusFile);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    handle_status_failure("Status file does not exist");
    return;
  }
  const auto mtime = std::filesystem::last_write_time(path, ec);
  if (ec) {
    handle_status_failure("Cannot stat status file: " + ec.message());
    return;
  }
  const int64_t age = file_age_ms(mtime);

  const bool has_valid = have_status_ && !status_.waiting && status_.version.has_value();
  if (has_valid && last_status_mtime_ && *last_status_mtime_ == mtime) {
    status_.age_ms = age;
    status_.alive = age < settings_.status_stale_ms;
    if (!status_.alive && was_alive_) {
      was_alive_ = false;
      log::warn("bridge: status file stale (" + std::to_string(age / 1000) + "s old)");
      bus_.emit(to_event(status_));
    }
    return;
  }

  std::string text;
  std::string error;
  if (!io::read_text_file(path, text, error)) {
    handle_status_failure(error);
    return;
  }
  if (is_blank(text)) {
    handle_status_failure("Status file is empty");
    return;
  }
  const json doc = json::parse(text, nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    handle_status_failure("Parse error: invalid JSON");
    return;
  }

  last_status_mtime_ = mtime;
  consecutive_failures_ = 0;

  BridgeStatus next;
  next.waiting = false;
  if (doc.contains("version") && !doc["version"].is_null()) {
    next.version = doc["version"].is_string() ? doc["version"].get<std::string>() : doc["version"].dump();
  }
  if (doc.contains("serverName") && doc["serverName"].is_string()) {
    next.server_name = doc["serverName"].get<std::string>();
  }
  if (doc.contains("playerCount") && doc["playerCount"].is_number()) {
    next.player_count = static_cast<int>(doc["playerCount"].get<double>());
  }
  const bool has_players = doc.contains("players") && doc["players"].is_array();
  if (has_players) {
    for (const auto& p : doc["players"]) {
      if (p.is_string()) next.players.push_back(p.get<std::string>());
    }
  }
  if (doc.contains("timestamp") && doc["timestamp"].is_number()) {
    next.timestamp = static_cast<int64_t>(doc["timestamp"].get<double>());
  }
  next.age_ms = age;
  next.alive = age < settings_.status_stale_ms;

  if (next.alive && has_players) {
    track_player_activity(next.players);
  }

  const bool changed = !have_status_ || status_.alive != next.alive || !same_status(status_, next);
  status_ = std::move(next);
  have_status_ = true;
  was_alive_ = status_.alive;
  if (changed) {
    if (status_.alive) {
      log::debug("bridge: mod connected (age: " + std::to_string(age / 1000) + "s)");
    }
    bus_.emit(to_event(status_));
  }
}

void CommandBridge::handle_status_failure(const std::string& reason) {
  ++consecutive_failures_;
  if (consecutive_failures_ == 1 || consecutive_failures_ % 10 == 0) {
    log::debug("bridge: status check failed (" + std::to_string(consecutive_failures_) + "x): " + reason);
  }

  if (have_status_ && status_.alive && consecutive_failures_ >= settings_.max_consecutive_failures) {
    // Version and server name survive; the player count becomes unknown.
    status_.alive = false;
    status_.error = reason;
    status_.consecutive_failures = consecutive_failures_;
    status_.player_count.reset();
    status_.players.clear();
    was_alive_ = false;
    bus_.emit(to_event(status_));
    log::warn("bridge: mod marked as disconnected after " + std::to_string(consecutive_failures_) +
              " failures");
  } else if (!have_status_) {
    status_ = BridgeStatus{};
    status_.consecutive_failures = consecutive_failures_;
    status_.error = reason;
  }
}

void CommandBridge::track_player_activity(const std::vector<std::string>& players) {
  std::unordered_set<std::string> current(players.begin(), players.end());
  for (const auto& name : players) {
    if (previous_players_.count(name) == 0) {
      log::info("bridge: player connected: " + name);
      bus_.emit(PlayerConnected{name});
    }
  }
  std::vector<std::string> departed;
  for (const auto& name : previous_players_) {
    if (current.count(name) == 0) {
      departed.push_back(name);
    }
  }
  std::sort(departed.begin(), departed.end());
  for (const auto& name : departed) {
    log::info("bridge: player disconnected: " + name);
    bus_.emit(PlayerDisconnected{name});
  }
  previous_players_ = std::move(current);
}

bool CommandBridge::watcher_active() const {
  return watcher_ != nullptr && watcher_->active();
}

void CommandBridge::setup_watcher() {
  teardown_watcher();
  if (watcher_retries_ >= settings_.max_watcher_retries) {
    log::warn("bridge: gave up on file watcher after " + std::to_string(settings_.max_watcher_retries) +
              " attempts; polling only");
    return;
  }

  auto watcher = std::make_unique<platform::FileWatcher>(watcher_backend_);
  if (!watcher->start(bridge_path_) || watcher->fd() < 0) {
    ++watcher_retries_;
    log::warn("bridge: could not set up file watcher (" + watcher->backend_name() + ")");
    if (watcher_retries_ < settings_.max_watcher_retries) {
      schedule_watcher_retry();
    } else {
      log::warn("bridge: gave up on file watcher; polling only");
    }
    return;
  }

  watched_fd_ = watcher->fd();
  watcher_ = std::move(watcher);
  loop_.watch_fd(watched_fd_, EventLoop::kReadable, [this](uint32_t events) { on_watcher_ready(events); });
  watcher_retries_ = 0;
  log::debug("bridge: file watcher active (" + watcher_->backend_name() + ")");
}

void CommandBridge::schedule_watcher_retry() {
  loop_.cancel(watcher_retry_timer_);
  watcher_retry_timer_ = loop_.call_later(milliseconds(settings_.watcher_retry_delay_ms), [this] {
    watcher_retry_timer_ = kInvalidTimer;
    if (running_ && !watcher_active()) {
      log::info("bridge: restarting file watcher (attempt " + std::to_string(watcher_retries_) + "/" +
                std::to_string(settings_.max_watcher_retries) + ")");
      setup_watcher();
    }
  });
}

void CommandBridge::teardown_watcher() {
  if (watched_fd_ >= 0) {
    loop_.unwatch_fd(watched_fd_);
    watched_fd_ = -1;
  }
  if (watcher_) {
    watcher_->stop();
    watcher_.reset();
  }
  loop_.cancel(debounce_timer_);
  debounce_timer_ = kInvalidTimer;
}

void CommandBridge::on_watcher_ready(uint32_t events) {
  if (!watcher_) {
    return;
  }
  std::vector<platform::FileChange> changes;
  watcher_->poll(changes);

  if ((events & EventLoop::kError) || !watcher_->active()) {
    log::warn("bridge: file watcher error; falling back to polling");
    teardown_watcher();
    ++watcher_retries_;
    if (watcher_retries_ < settings_.max_watcher_retries) {
      schedule_watcher_retry();
    } else {
      log::warn("bridge: gave up on file watcher; polling only");
    }
  }

  for (const auto& change : changes) {
    const auto name = change.path.filename().string();
    if (name == kStatusFile) {
      dirty_status_ = true;
    } else if (name == kResultsFile) {
      dirty_results_ = true;
    }
  }
  if (!dirty_status_ && !dirty_results_) {
    return;
  }
  loop_.cancel(debounce_timer_);
  debounce_timer_ = loop_.call_later(milliseconds(settings_.debounce_ms), [this] { on_debounce(); });
}

void CommandBridge::on_debounce() {
  debounce_timer_ = kInvalidTimer;
  const bool status = dirty_status_;
  const bool results = dirty_results_;
  dirty_status_ = false;
  dirty_results_ = false;
  if (!running_) {
    return;
  }
  if (status) {
    check_mod_status();
  }
  if (results) {
    poll_results();
  }
}

BridgeDiagnostics CommandBridge::get_status() const {
  BridgeDiagnostics out;
  out.configured = configured();
  out.bridge_path = bridge_path_.string();
  out.running = running_;
  out.pending_commands = pending_.size();
  out.status = status_;
  out.consecutive_failures = consecutive_failures_;
  out.config = settings_;
  out.watcher_active = watcher_active();
  out.watcher_backend = watcher_ ? watcher_->backend_name() : "none";

  if (configured()) {
    const auto path = file_path(kStatusFile);
    out.status_file.path = path.string();
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
      out.status_file.exists = true;
      out.status_file.size = std::filesystem::file_size(path, ec);
      const auto mtime = std::filesystem::last_write_time(path, ec);
      if (ec) {
        out.status_file.error = ec.message();
      } else {
        out.status_file.age_ms = file_age_ms(mtime);
      }
    }
  }
  return out;
}

Future<BridgeResult> CommandBridge::ping() {
  if (!running_) {
    return make_failed_future<BridgeResult>(make_error(ErrorKind::BridgeStopped, "Bridge not running"));
  }
  if (!is_mod_connected()) {
    return make_failed_future<BridgeResult>(make_error(ErrorKind::BridgeStale, "Mod not connected"));
  }
  return send_command("ping");
}

Future<BridgeResult> CommandBridge::get_server_info() {
  return send_command("getServerInfo");
}

Future<BridgeResult> CommandBridge::save_world() {
  return send_command("saveWorld");
}

Future<BridgeResult> CommandBridge::send_server_message(const std::string& message,
                                                        const std::string& color) {
  return send_command("sendServerMessage", {{"message", message}, {"color", color}});
}

} // namespace gsc::bridge
