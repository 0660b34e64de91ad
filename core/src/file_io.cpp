#include "gsc/file_io.h"

#include <fstream>
#include <sstream>

#include <unistd.h>

namespace gsc::io {

namespace {
bool write_plain(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out << contents;
  out.flush();
  return static_cast<bool>(out);
}
} // namespace

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    error = "failed to read file: " + path.string();
    return false;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

bool write_text_file_atomic(const std::filesystem::path& path, const std::string& contents,
                            std::string& error) {
  std::filesystem::path temp = path;
  temp += ".tmp." + std::to_string(::getpid());
  if (!write_plain(temp, contents)) {
    error = "failed to write temp file: " + temp.string();
    std::error_code ec;
    std::filesystem::remove(temp, ec);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(temp, path, ec);
  if (!ec) {
    return true;
  }

  const bool direct_ok = write_plain(path, contents);
  std::error_code remove_ec;
  std::filesystem::remove(temp, remove_ec);
  if (!direct_ok) {
    error = "failed to write file: " + path.string() + " (rename: " + ec.message() + ")";
    return false;
  }
  return true;
}

bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error) {
  std::string text;
  if (!read_text_file(path, text, error)) {
    return false;
  }
  if (text.find_first_not_of(" \t\r\n") == std::string::npos) {
    error = "empty file: " + path.string();
    return false;
  }
  out = nlohmann::json::parse(text, nullptr, false);
  if (out.is_discarded()) {
    error = "invalid JSON: " + path.string();
    return false;
  }
  return true;
}

} // namespace gsc::io
