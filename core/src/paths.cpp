#include "gsc/paths.h"

#include "gsc/log.h"

#include <cstdlib>

#include <unistd.h>

namespace gsc {

namespace {
std::filesystem::path executable_dir(const char* argv0) {
#if defined(__linux__)
  char buffer[4096];
  const ssize_t len = readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
  if (len > 0) {
    buffer[len] = '\0';
    return std::filesystem::path(buffer).parent_path();
  }
#endif
  if (argv0) {
    return std::filesystem::absolute(argv0).parent_path();
  }
  return std::filesystem::current_path();
}

std::filesystem::path find_root_from(const std::filesystem::path& start) {
  std::filesystem::path cur = start;
  for (int i = 0; i < 6; ++i) {
    std::error_code ec;
    if (std::filesystem::is_directory(cur / "config", ec)) {
      return cur;
    }
    if (cur.has_parent_path() && cur.parent_path() != cur) {
      cur = cur.parent_path();
    } else {
      break;
    }
  }
  return start;
}

std::filesystem::path resolve_config_path(const std::filesystem::path& root,
                                          const std::optional<std::filesystem::path>& override) {
  if (override.has_value()) {
    const auto p = override.value();
    if (p.is_absolute()) return p;
    return std::filesystem::absolute(p);
  }
  if (const char* env = std::getenv("GSC_CONFIG")) {
    return std::filesystem::path(env);
  }
  const auto yaml = root / "config" / "gsc.yaml";
  std::error_code ec;
  if (!std::filesystem::exists(yaml, ec)) {
    const auto json = root / "config" / "gsc.json";
    if (std::filesystem::exists(json, ec)) {
      return json;
    }
  }
  return yaml;
}
} // namespace

ResolvedPaths resolve_paths(const char* argv0,
                            const std::optional<std::filesystem::path>& config_override) {
  ResolvedPaths out;
  if (const char* env_root = std::getenv("GSC_ROOT")) {
    out.root = std::filesystem::path(env_root);
  } else {
    out.root = find_root_from(executable_dir(argv0));
  }

  out.config_file = resolve_config_path(out.root, config_override);
  out.logs_dir = out.root / "logs";

  std::error_code ec;
  if (!std::filesystem::exists(out.config_file, ec)) {
    log::warn(std::string("config file not found: ") + out.config_file.string());
  }

  return out;
}

} // namespace gsc
