#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace gsc::bridge {

struct BridgeLocation {
  std::filesystem::path path;
  bool exists = false;
  bool has_status = false;
  bool has_init = false;
  std::vector<std::filesystem::path> candidates;
};

// Finds the per-server bridge directory the in-game script writes to.
// Candidates, most preferred first:
//   {data}/Lua/panelbridge/{name}
//   {install parent}/Server_files*/Lua/panelbridge/{name}
//   {install}/Lua/panelbridge/{name}
// A candidate holding status.json wins, then one holding .init, then any
// existing directory. When none exist the best expected path is returned
// with exists == false.
BridgeLocation locate_bridge_dir(const std::string& server_name, const std::filesystem::path& data_path,
                                 const std::filesystem::path& install_path);

} // namespace gsc::bridge
