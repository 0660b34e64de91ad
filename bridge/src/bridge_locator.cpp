#include "gsc_bridge/bridge_locator.h"

#include "gsc_bridge/command_bridge.h"

#include "gsc/log.h"

#include <algorithm>

namespace gsc::bridge {

namespace {
std::filesystem::path bridge_subdir(const std::filesystem::path& base, const std::string& name) {
  return base / "Lua" / "panelbridge" / name;
}

bool is_dir(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

bool is_file(const std::filesystem::path& p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

std::vector<std::filesystem::path> server_files_dirs(const std::filesystem::path& install) {
  std::vector<std::filesystem::path> out;
  const auto parent = install.parent_path();
  if (parent.empty() || !is_dir(parent)) {
    return out;
  }
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator(parent, ec)) {
    if (!entry.is_directory(ec)) continue;
    const auto name = entry.path().filename().string();
    if (name.rfind("Server_files", 0) == 0) {
      out.push_back(entry.path());
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}
} // namespace

BridgeLocation locate_bridge_dir(const std::string& server_name, const std::filesystem::path& data_path,
                                 const std::filesystem::path& install_path) {
  BridgeLocation location;
  std::filesystem::path first_server_files;

  if (!data_path.empty()) {
    location.candidates.push_back(bridge_subdir(data_path, server_name));
  }
  if (!install_path.empty()) {
    for (const auto& dir : server_files_dirs(install_path)) {
      location.candidates.push_back(bridge_subdir(dir, server_name));
      if (first_server_files.empty()) {
        first_server_files = location.candidates.back();
      }
    }
    location.candidates.push_back(bridge_subdir(install_path, server_name));
  }
  if (location.candidates.empty()) {
    return location;
  }

  auto pick = [&location](const std::filesystem::path& p) {
    location.path = p;
    location.exists = is_dir(p);
    location.has_status = is_file(p / kStatusFile);
    location.has_init = is_file(p / ".init");
  };

  for (const auto& candidate : location.candidates) {
    if (is_file(candidate / kStatusFile)) {
      pick(candidate);
      log::debug("bridge: found active bridge at " + candidate.string());
      return location;
    }
  }
  for (const auto& candidate : location.candidates) {
    if (is_file(candidate / ".init")) {
      pick(candidate);
      log::debug("bridge: found initialized bridge at " + candidate.string());
      return location;
    }
  }
  for (const auto& candidate : location.candidates) {
    if (is_dir(candidate)) {
      pick(candidate);
      return location;
    }
  }

  // Nothing on disk yet; the mod creates the directory on its first run.
  pick(first_server_files.empty() ? location.candidates.front() : first_server_files);
  return location;
}

} // namespace gsc::bridge
