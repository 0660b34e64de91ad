#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace gsc::log {

enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void init();
void init(const std::string& app_name, const std::filesystem::path& root);
void shutdown();
void install_crash_handlers();

void set_level(Level level);
Level level();
bool parse_level(std::string_view text, Level& out);

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

std::vector<std::string> recent(size_t max_entries = 200);

// Receives every emitted line (after level filtering). Returns a handle for remove_sink.
using Sink = std::function<void(Level, const std::string& line)>;
int add_sink(Sink sink);
void remove_sink(int handle);

// Lets one message through per cooldown window; used for repeated connection failures.
class Throttle {
 public:
  explicit Throttle(std::chrono::milliseconds cooldown) : cooldown_(cooldown) {}

  bool allow(std::chrono::steady_clock::time_point now);
  void reset() { last_ = {}; }
  void set_cooldown(std::chrono::milliseconds cooldown) { cooldown_ = cooldown; }

 private:
  std::chrono::milliseconds cooldown_;
  std::chrono::steady_clock::time_point last_{};
};

} // namespace gsc::log
