#include "gsc_platform/file_watcher.h"

#include "gsc/log.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <unordered_map>

#if defined(__linux__)
#include <sys/inotify.h>
#include <unistd.h>
#endif

namespace gsc::platform {

struct FileWatcher::Impl {
  virtual ~Impl() = default;
  virtual bool start(const std::filesystem::path& dir) = 0;
  virtual void poll(std::vector<FileChange>& out_changes) = 0;
  virtual void stop() = 0;
  virtual bool active() const = 0;
  virtual int fd() const { return -1; }
  virtual std::string name() const = 0;
};

class PollingWatcher final : public FileWatcher::Impl {
 public:
  bool start(const std::filesystem::path& dir) override {
    dir_ = dir;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir_, ec)) {
      return false;
    }
    snapshot();
    active_ = true;
    return true;
  }

  void poll(std::vector<FileChange>& out_changes) override {
    if (!active_) return;
    std::unordered_map<std::string, int64_t> current;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
      if (!entry.is_regular_file(ec)) continue;
      const auto path = entry.path();
      const auto key = path.generic_string();
      const auto mtime = file_mtime_ticks(path);
      current[key] = mtime;
      auto it = mtimes_.find(key);
      if (it == mtimes_.end()) {
        out_changes.push_back({path, FileChange::Type::Added});
      } else if (it->second != mtime) {
        out_changes.push_back({path, FileChange::Type::Modified});
      }
    }
    for (const auto& prev : mtimes_) {
      if (current.find(prev.first) == current.end()) {
        out_changes.push_back({prev.first, FileChange::Type::Removed});
      }
    }
    mtimes_.swap(current);
  }

  void stop() override {
    mtimes_.clear();
    active_ = false;
  }

  bool active() const override { return active_; }
  std::string name() const override { return "polling"; }

 private:
  int64_t file_mtime_ticks(const std::filesystem::path& path) {
    std::error_code ec;
    auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) return 0;
    return static_cast<int64_t>(ftime.time_since_epoch().count());
  }

  void snapshot() {
    mtimes_.clear();
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(dir_, ec)) {
      if (!entry.is_regular_file(ec)) continue;
      mtimes_[entry.path().generic_string()] = file_mtime_ticks(entry.path());
    }
  }

  std::filesystem::path dir_;
  std::unordered_map<std::string, int64_t> mtimes_;
  bool active_ = false;
};

#if defined(__linux__)
class InotifyWatcher final : public FileWatcher::Impl {
 public:
  ~InotifyWatcher() override { stop(); }

  bool start(const std::filesystem::path& dir) override {
    stop();
    dir_ = dir;
    fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ < 0) {
      gsc::log::warn(std::string("inotify init failed: ") + std::strerror(errno));
      return false;
    }
    wd_ = inotify_add_watch(fd_, dir_.c_str(),
                            IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE | IN_MOVED_FROM |
                                IN_MOVED_TO | IN_DELETE_SELF);
    if (wd_ < 0) {
      gsc::log::warn(std::string("inotify watch failed for ") + dir_.string() + ": " +
                     std::strerror(errno));
      stop();
      return false;
    }
    return true;
  }

  void poll(std::vector<FileChange>& out_changes) override {
    if (fd_ < 0) return;
    alignas(struct inotify_event) char buffer[4096];
    ssize_t len = 0;
    while ((len = read(fd_, buffer, sizeof(buffer))) > 0) {
      size_t offset = 0;
      while (offset < static_cast<size_t>(len)) {
        const auto* event = reinterpret_cast<const struct inotify_event*>(buffer + offset);
        offset += sizeof(struct inotify_event) + event->len;
        if (event->mask & (IN_DELETE_SELF | IN_IGNORED)) {
          // The directory itself went away; the watch is dead.
          gsc::log::warn("watched directory removed: " + dir_.string());
          stop();
          return;
        }
        if (event->wd != wd_ || event->len == 0) {
          continue;
        }
        const std::filesystem::path path = dir_ / std::string(event->name);
        if (event->mask & (IN_CREATE | IN_MOVED_TO)) {
          out_changes.push_back({path, FileChange::Type::Added});
        } else if (event->mask & (IN_DELETE | IN_MOVED_FROM)) {
          out_changes.push_back({path, FileChange::Type::Removed});
        } else if (event->mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
          out_changes.push_back({path, FileChange::Type::Modified});
        }
      }
    }
  }

  void stop() override {
    if (fd_ >= 0) {
      close(fd_);
      fd_ = -1;
    }
    wd_ = -1;
  }

  bool active() const override { return fd_ >= 0; }
  int fd() const override { return fd_; }
  std::string name() const override { return "inotify"; }

 private:
  int fd_ = -1;
  int wd_ = -1;
  std::filesystem::path dir_;
};
#endif

FileWatcher::FileWatcher() : FileWatcher(Backend::Native) {}

FileWatcher::FileWatcher(Backend backend) {
#if defined(__linux__)
  if (backend == Backend::Native) {
    impl_ = new InotifyWatcher();
    return;
  }
#else
  (void)backend;
#endif
  impl_ = new PollingWatcher();
}

FileWatcher::~FileWatcher() {
  if (impl_) {
    impl_->stop();
    delete impl_;
  }
}

bool FileWatcher::start(const std::filesystem::path& dir) {
  return impl_->start(dir);
}

void FileWatcher::poll(std::vector<FileChange>& out_changes) {
  if (impl_) {
    impl_->poll(out_changes);
  }
}

void FileWatcher::stop() {
  if (impl_) {
    impl_->stop();
  }
}

bool FileWatcher::active() const {
  return impl_ && impl_->active();
}

std::string FileWatcher::backend_name() const {
  return impl_ ? impl_->name() : "none";
}

int FileWatcher::fd() const {
  return impl_ ? impl_->fd() : -1;
}

} // namespace gsc::platform
