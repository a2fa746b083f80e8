#include "cmdai/json_file.hpp"

#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

#include "cmdai/errors.hpp"

namespace cmdai {

std::optional<nlohmann::json> read_json_file(const std::string& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::nullopt;
  }

  std::ifstream in(path);
  if (!in.is_open()) {
    throw PersistenceError("failed to open for reading: " + path);
  }
  return nlohmann::json::parse(in);
}

void write_json_file(const std::string& path, const nlohmann::json& value) {
  const std::filesystem::path target(path);
  const std::filesystem::path parent = target.parent_path();
  std::error_code ec;
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw PersistenceError("failed to create directory " + parent.string() + ": " + ec.message());
    }
  }

  // Invalid UTF-8 in free text (queries, responses) is replaced rather than failing the write.
  std::string serialized;
  try {
    serialized = value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
  } catch (const nlohmann::json::exception& ex) {
    throw PersistenceError("failed to serialize " + path + ": " + ex.what());
  }

  const std::filesystem::path tempPath =
      target.string() + ".tmp-" + std::to_string(static_cast<long long>(::getpid()));
  {
    std::ofstream out(tempPath, std::ios::trunc);
    if (!out.is_open()) {
      throw PersistenceError("failed to open for writing: " + tempPath.string());
    }
    out << serialized << "\n";
    out.flush();
    if (!out.good()) {
      out.close();
      std::filesystem::remove(tempPath, ec);
      throw PersistenceError("failed writing: " + tempPath.string());
    }
  }

  std::filesystem::rename(tempPath, target, ec);
  if (ec) {
    const std::string reason = ec.message();
    std::filesystem::remove(tempPath, ec);
    throw PersistenceError("failed to replace " + path + ": " + reason);
  }
}

}  // namespace cmdai
