#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gsc {

struct RconConnected {
  std::string host;
  uint16_t port = 0;
};

struct RconDisconnected {
  std::string reason;
};

struct BridgeStarted {
  std::string path;
};

struct BridgeStopped {};

struct ModStatusChanged {
  bool alive = false;
  std::optional<std::string> version;
  std::optional<std::string> server_name;
  std::optional<int> player_count;
  std::vector<std::string> players;
};

struct PlayerConnected {
  std::string name;
};

struct PlayerDisconnected {
  std::string name;
};

struct BridgeResultReceived {
  std::string id;
  bool success = false;
  nlohmann::json data;
  std::string error;
};

struct RestartPhaseChanged {
  std::string phase;
  std::string message;
};

} // namespace gsc
