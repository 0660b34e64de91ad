#include "gsc_rcon/packet.h"

namespace gsc::rcon {

namespace {
void put_i32(std::string& out, int32_t value) {
  const uint32_t v = static_cast<uint32_t>(value);
  out.push_back(static_cast<char>(v & 0xFF));
  out.push_back(static_cast<char>((v >> 8) & 0xFF));
  out.push_back(static_cast<char>((v >> 16) & 0xFF));
  out.push_back(static_cast<char>((v >> 24) & 0xFF));
}

int32_t get_i32(const std::string& in, size_t offset) {
  const auto b = [&](size_t i) { return static_cast<uint32_t>(static_cast<unsigned char>(in[offset + i])); };
  return static_cast<int32_t>(b(0) | (b(1) << 8) | (b(2) << 16) | (b(3) << 24));
}
} // namespace

bool encode_packet(const Packet& packet, std::string& out, std::string& error) {
  if (packet.body.size() > kMaxBody) {
    error = "rcon body exceeds " + std::to_string(kMaxBody) + " bytes";
    return false;
  }
  if (packet.body.find('\0') != std::string::npos) {
    error = "rcon body contains NUL";
    return false;
  }
  const int32_t size = static_cast<int32_t>(sizeof(int32_t) * 2 + packet.body.size() + 2);
  put_i32(out, size);
  put_i32(out, packet.id);
  put_i32(out, packet.type);
  out.append(packet.body);
  out.push_back('\0');
  out.push_back('\0');
  return true;
}

DecodeStatus decode_packet(const std::string& buffer, Packet& out, size_t& consumed,
                           std::string& error) {
  consumed = 0;
  if (buffer.size() < sizeof(int32_t)) {
    return DecodeStatus::NeedMore;
  }
  const int32_t size = get_i32(buffer, 0);
  if (size < static_cast<int32_t>(kMinPacketSize) || size > static_cast<int32_t>(kMaxPacketSize)) {
    error = "rcon packet size out of range: " + std::to_string(size);
    return DecodeStatus::Malformed;
  }
  const size_t total = sizeof(int32_t) + static_cast<size_t>(size);
  if (buffer.size() < total) {
    return DecodeStatus::NeedMore;
  }
  out.id = get_i32(buffer, 4);
  out.type = get_i32(buffer, 8);
  // Body runs to the first NUL; the trailing empty string terminator follows.
  const size_t body_start = 12;
  const size_t body_end_max = total - 1;
  size_t body_end = buffer.find('\0', body_start);
  if (body_end == std::string::npos || body_end > body_end_max) {
    error = "rcon packet body not terminated";
    return DecodeStatus::Malformed;
  }
  out.body.assign(buffer, body_start, body_end - body_start);
  consumed = total;
  return DecodeStatus::Ok;
}

} // namespace gsc::rcon
