#pragma once

#include <filesystem>
#include <optional>

namespace gsc {

struct ResolvedPaths {
  std::filesystem::path root;
  std::filesystem::path config_file;
  std::filesystem::path logs_dir;
};

// GSC_ROOT and GSC_CONFIG take precedence; otherwise the root is found by
// walking up from the executable to the first directory holding config/.
ResolvedPaths resolve_paths(const char* argv0,
                            const std::optional<std::filesystem::path>& config_override);

} // namespace gsc
