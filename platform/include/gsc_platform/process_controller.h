#pragma once

#include "gsc/future.h"

#include <filesystem>
#include <string>
#include <vector>

namespace gsc::platform {

struct LaunchSpec {
  std::vector<std::string> command;
  std::filesystem::path cwd;
  // Substring of /proc/<pid>/cmdline identifying the server; empty tracks the launched child only.
  std::string match;
};

class ProcessController {
 public:
  virtual ~ProcessController() = default;

  virtual bool is_alive() = 0;
  // Suspension-point form of is_alive(), raced against a timeout by callers.
  virtual Future<bool> check_alive() { return make_ready_future(is_alive()); }
  virtual bool launch(std::string& error) = 0;
  // Returns true when at least one process was signalled.
  virtual bool kill(std::string& error) = 0;
};

class PosixProcessController final : public ProcessController {
 public:
  explicit PosixProcessController(LaunchSpec spec);
  ~PosixProcessController() override;

  bool is_alive() override;
  bool launch(std::string& error) override;
  bool kill(std::string& error) override;

  int child_pid() const { return child_pid_; }

 private:
  std::vector<int> matching_pids() const;
  bool child_running();

  LaunchSpec spec_;
  int child_pid_ = -1;
};

} // namespace gsc::platform
