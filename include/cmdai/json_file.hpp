#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace cmdai {

// std::nullopt when the file does not exist. Throws nlohmann::json::parse_error on malformed content and
// PersistenceError when the file exists but cannot be read.
std::optional<nlohmann::json> read_json_file(const std::string& path);

// Writes to a sibling temp file and renames it over `path`. Throws PersistenceError.
void write_json_file(const std::string& path, const nlohmann::json& value);

}  // namespace cmdai
