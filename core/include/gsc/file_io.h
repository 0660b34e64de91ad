#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace gsc::io {

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error);

// Writes to a sibling temp file and renames it over the target. When the rename
// fails the contents are written directly and the temp file is removed.
bool write_text_file_atomic(const std::filesystem::path& path, const std::string& contents,
                            std::string& error);

// Fails on missing, empty or unparsable files.
bool load_json_file(const std::filesystem::path& path, nlohmann::json& out, std::string& error);

} // namespace gsc::io
