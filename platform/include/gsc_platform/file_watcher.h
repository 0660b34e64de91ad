#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace gsc::platform {

struct FileChange {
  enum class Type { Added, Modified, Removed };
  std::filesystem::path path;
  Type type = Type::Modified;
};

// Watches the files directly inside one directory.
class FileWatcher {
 public:
  enum class Backend { Native, Polling };

  FileWatcher();
  explicit FileWatcher(Backend backend);
  ~FileWatcher();

  FileWatcher(const FileWatcher&) = delete;
  FileWatcher& operator=(const FileWatcher&) = delete;

  bool start(const std::filesystem::path& dir);
  void poll(std::vector<FileChange>& out_changes);
  void stop();
  bool active() const;
  std::string backend_name() const;

  // Readable when changes are queued; -1 for backends without a descriptor.
  int fd() const;

  struct Impl;

 private:
  Impl* impl_ = nullptr;
};

} // namespace gsc::platform
