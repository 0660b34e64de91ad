#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace gsc::rcon {

// Source-style RCON framing: int32 size, int32 id, int32 type, body, two NULs.
// All integers little-endian; size counts everything after itself.
constexpr int32_t kTypeAuth = 3;
constexpr int32_t kTypeAuthResponse = 2;
constexpr int32_t kTypeExecCommand = 2;
constexpr int32_t kTypeResponseValue = 0;

constexpr int32_t kAuthDeniedId = -1;

constexpr size_t kMaxBody = 4096;
constexpr size_t kMinPacketSize = sizeof(int32_t) * 2 + 1 + 1;
// Servers may pad oversized responses; accept up to two maximal bodies per frame.
constexpr size_t kMaxPacketSize = sizeof(int32_t) * 2 + kMaxBody * 2;

struct Packet {
  int32_t id = 0;
  int32_t type = 0;
  std::string body;
};

enum class DecodeStatus { Ok, NeedMore, Malformed };

bool encode_packet(const Packet& packet, std::string& out, std::string& error);

// Decodes one frame from the front of buffer. On Ok, consumed is the frame length.
DecodeStatus decode_packet(const std::string& buffer, Packet& out, size_t& consumed,
                           std::string& error);

// A body this long may continue in further packets with the same id.
inline bool body_may_continue(const Packet& packet) {
  return packet.body.size() >= kMaxBody;
}

} // namespace gsc::rcon
