#include "gsc/log.h"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <deque>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>

namespace gsc::log {

namespace {
std::mutex g_log_mutex;
std::ofstream g_log_file;
std::deque<std::string> g_ring;
constexpr size_t kRingMax = 200;
std::string g_app_name = "gsc";
std::filesystem::path g_root_path;
std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::map<int, Sink> g_sinks;
int g_next_sink = 1;

std::string timestamp_now() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto tt = system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::string timestamp_for_filename() {
  using namespace std::chrono;
  const auto now = system_clock::now();
  const auto tt = system_clock::to_time_t(now);
  std::tm tm{};
  localtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y%m%d_%H%M%S");
  return oss.str();
}

const char* level_name(Level level) {
  switch (level) {
    case Level::Debug: return "DEBUG";
    case Level::Info: return "INFO";
    case Level::Warn: return "WARN";
    case Level::Error: return "ERROR";
  }
  return "INFO";
}

void log_line(Level level, std::string_view msg) {
  if (static_cast<int>(level) < g_level.load()) {
    return;
  }
  std::map<int, Sink> sinks;
  std::string line;
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    line = "[" + timestamp_now() + "][" + level_name(level) + "] " + std::string(msg);
    std::cout << line << "\n";
    if (g_log_file.is_open()) {
      g_log_file << line << "\n";
      g_log_file.flush();
    }
    g_ring.push_back(line);
    if (g_ring.size() > kRingMax) {
      g_ring.pop_front();
    }
    sinks = g_sinks;
  }
  for (const auto& entry : sinks) {
    entry.second(level, line);
  }
}
} // namespace

void init() {
  init("gsc", std::filesystem::current_path());
}

void init(const std::string& app_name, const std::filesystem::path& root) {
  g_app_name = app_name;
  g_root_path = root;
  std::filesystem::path log_dir = g_root_path / "logs";
  std::error_code ec;
  std::filesystem::create_directories(log_dir, ec);
  const std::string file_name = g_app_name + "_" + timestamp_for_filename() + ".log";
  const std::filesystem::path log_path = log_dir / file_name;
  {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file.is_open()) {
      g_log_file.close();
    }
    g_log_file.open(log_path, std::ios::out | std::ios::app);
  }
  log_line(Level::Info, "log init");
#if defined(__linux__)
  log_line(Level::Info, "platform: linux");
#else
  log_line(Level::Info, "platform: unknown");
#endif
#ifdef GSC_DEBUG
  log_line(Level::Info, "build: debug");
#else
  log_line(Level::Info, "build: release");
#endif
#ifdef GSC_GIT_HASH
  log_line(Level::Info, std::string("git: ") + GSC_GIT_HASH);
#endif
}

void shutdown() {
  log_line(Level::Info, "log shutdown");
  std::lock_guard<std::mutex> lock(g_log_mutex);
  if (g_log_file.is_open()) {
    g_log_file.close();
  }
}

void set_level(Level level) {
  g_level = static_cast<int>(level);
}

Level level() {
  return static_cast<Level>(g_level.load());
}

bool parse_level(std::string_view text, Level& out) {
  if (text == "debug") {
    out = Level::Debug;
  } else if (text == "info") {
    out = Level::Info;
  } else if (text == "warn" || text == "warning") {
    out = Level::Warn;
  } else if (text == "error") {
    out = Level::Error;
  } else {
    return false;
  }
  return true;
}

void debug(std::string_view msg) {
  log_line(Level::Debug, msg);
}

void info(std::string_view msg) {
  log_line(Level::Info, msg);
}

void warn(std::string_view msg) {
  log_line(Level::Warn, msg);
}

void error(std::string_view msg) {
  log_line(Level::Error, msg);
}

std::vector<std::string> recent(size_t max_entries) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const size_t count = std::min(max_entries, g_ring.size());
  return std::vector<std::string>(g_ring.end() - count, g_ring.end());
}

int add_sink(Sink sink) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  const int handle = g_next_sink++;
  g_sinks[handle] = std::move(sink);
  return handle;
}

void remove_sink(int handle) {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  g_sinks.erase(handle);
}

bool Throttle::allow(std::chrono::steady_clock::time_point now) {
  if (last_ != std::chrono::steady_clock::time_point{} && now - last_ < cooldown_) {
    return false;
  }
  last_ = now;
  return true;
}

namespace {
void signal_handler(int sig) {
  log_line(Level::Error, std::string("crash signal: ") + std::to_string(sig));
  std::_Exit(1);
}
} // namespace

void install_crash_handlers() {
  std::signal(SIGSEGV, signal_handler);
  std::signal(SIGABRT, signal_handler);
  std::signal(SIGFPE, signal_handler);
  std::signal(SIGILL, signal_handler);
}

} // namespace gsc::log
