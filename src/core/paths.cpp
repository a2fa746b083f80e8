#include "cmdai/paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include <pwd.h>
#include <unistd.h>

namespace cmdai {
namespace {

std::string env_or_empty(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr ? value : "";
}

std::string in_home(const char* fileName) {
  return (std::filesystem::path(home_directory()) / fileName).string();
}

}  // namespace

std::string home_directory() {
  std::string home = env_or_empty("HOME");
  if (home.empty()) {
    if (const passwd* entry = ::getpwuid(::getuid()); entry != nullptr && entry->pw_dir != nullptr) {
      home = entry->pw_dir;
    }
  }
  if (home.empty()) {
    throw std::runtime_error("cannot determine home directory (HOME is unset)");
  }
  return home;
}

std::string default_config_path() {
  const std::string overridden = env_or_empty("CMDAI_CONFIG");
  return overridden.empty() ? in_home(".cmd_ai_config.json") : overridden;
}

std::string default_history_path() {
  const std::string overridden = env_or_empty("CMDAI_HISTORY");
  return overridden.empty() ? in_home(".cmd_ai_history.json") : overridden;
}

std::string default_readline_history_path() { return in_home(".cmd_ai_readline_history"); }

}  // namespace cmdai
