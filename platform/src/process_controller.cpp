#include "gsc_platform/process_controller.h"

#include "gsc/log.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gsc::platform {

namespace {
constexpr auto kTermGrace = std::chrono::milliseconds(500);
constexpr auto kTermPoll = std::chrono::milliseconds(50);

bool is_executable(const std::filesystem::path& path) {
  return ::access(path.c_str(), X_OK) == 0;
}

bool resolve_executable(const std::string& name) {
  if (name.find('/') != std::string::npos) {
    return is_executable(name);
  }
  const char* env_path = std::getenv("PATH");
  if (!env_path) {
    return false;
  }
  std::stringstream ss(env_path);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) dir = ".";
    if (is_executable(std::filesystem::path(dir) / name)) {
      return true;
    }
  }
  return false;
}

std::string read_cmdline(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return {};
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  std::replace(text.begin(), text.end(), '\0', ' ');
  return text;
}

bool pid_exists(int pid) {
  return ::kill(pid, 0) == 0 || errno == EPERM;
}
} // namespace

PosixProcessController::PosixProcessController(LaunchSpec spec) : spec_(std::move(spec)) {}

PosixProcessController::~PosixProcessController() {
  // The server outlives the control plane; only reap if it already exited.
  if (child_pid_ > 0) {
    ::waitpid(child_pid_, nullptr, WNOHANG);
  }
}

std::vector<int> PosixProcessController::matching_pids() const {
  std::vector<int> out;
  if (spec_.match.empty()) {
    return out;
  }
  const int self = static_cast<int>(::getpid());
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
    const std::string name = entry.path().filename().string();
    if (name.empty() || !std::all_of(name.begin(), name.end(), ::isdigit)) {
      continue;
    }
    const int pid = std::atoi(name.c_str());
    if (pid == self) continue;
    const std::string cmdline = read_cmdline(entry.path() / "cmdline");
    if (!cmdline.empty() && cmdline.find(spec_.match) != std::string::npos) {
      out.push_back(pid);
    }
  }
  return out;
}

bool PosixProcessController::child_running() {
  if (child_pid_ <= 0) {
    return false;
  }
  int status = 0;
  const pid_t rc = ::waitpid(child_pid_, &status, WNOHANG);
  if (rc == 0) {
    return true;
  }
  if (rc == child_pid_ || (rc < 0 && errno == ECHILD)) {
    child_pid_ = -1;
  }
  return false;
}

bool PosixProcessController::is_alive() {
  if (child_running()) {
    return true;
  }
  return !matching_pids().empty();
}

bool PosixProcessController::launch(std::string& error) {
  if (spec_.command.empty()) {
    error = "launch command not configured";
    return false;
  }
  if (!resolve_executable(spec_.command.front())) {
    error = "executable not found: " + spec_.command.front();
    return false;
  }
  if (is_alive()) {
    error = "server process already running";
    return false;
  }

  int status_pipe[2];
  if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
    error = std::string("pipe failed: ") + std::strerror(errno);
    return false;
  }

  const pid_t pid = ::fork();
  if (pid == 0) {
    ::close(status_pipe[0]);
    ::setsid();
    if (!spec_.cwd.empty() && ::chdir(spec_.cwd.c_str()) != 0) {
      const int err = errno;
      (void)!::write(status_pipe[1], &err, sizeof(err));
      _exit(127);
    }
    const int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDOUT_FILENO);
      ::dup2(devnull, STDERR_FILENO);
      if (devnull > STDERR_FILENO) ::close(devnull);
    }
    std::vector<char*> cargs;
    cargs.reserve(spec_.command.size() + 1);
    for (const auto& arg : spec_.command) {
      cargs.push_back(const_cast<char*>(arg.c_str()));
    }
    cargs.push_back(nullptr);
    ::execvp(cargs[0], cargs.data());
    const int err = errno;
    (void)!::write(status_pipe[1], &err, sizeof(err));
    _exit(127);
  }

  ::close(status_pipe[1]);
  if (pid < 0) {
    ::close(status_pipe[0]);
    error = std::string("fork failed: ") + std::strerror(errno);
    return false;
  }

  // EOF on the CLOEXEC pipe means exec succeeded.
  int child_errno = 0;
  ssize_t n = 0;
  do {
    n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);
  ::close(status_pipe[0]);
  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    ::waitpid(pid, nullptr, 0);
    error = std::string("exec failed: ") + std::strerror(child_errno);
    return false;
  }

  child_pid_ = static_cast<int>(pid);
  gsc::log::info("launched server process pid " + std::to_string(child_pid_));
  return true;
}

bool PosixProcessController::kill(std::string& error) {
  std::vector<int> targets = matching_pids();
  if (child_running() && std::find(targets.begin(), targets.end(), child_pid_) == targets.end()) {
    targets.push_back(child_pid_);
  }
  if (targets.empty()) {
    error = "no server process found";
    return false;
  }

  bool signalled = false;
  for (int pid : targets) {
    if (::kill(pid, SIGTERM) == 0) {
      signalled = true;
    } else {
      gsc::log::warn("SIGTERM failed for pid " + std::to_string(pid) + ": " + std::strerror(errno));
    }
  }

  const auto deadline = std::chrono::steady_clock::now() + kTermGrace;
  while (std::chrono::steady_clock::now() < deadline) {
    child_running();
    const bool any_alive = std::any_of(targets.begin(), targets.end(), pid_exists);
    if (!any_alive) break;
    std::this_thread::sleep_for(kTermPoll);
  }

  for (int pid : targets) {
    if (pid_exists(pid) && ::kill(pid, SIGKILL) == 0) {
      gsc::log::warn("server pid " + std::to_string(pid) + " ignored SIGTERM; sent SIGKILL");
      signalled = true;
    }
  }
  child_running();
  if (!signalled) {
    error = "failed to signal server process";
  }
  return signalled;
}

} // namespace gsc::platform
