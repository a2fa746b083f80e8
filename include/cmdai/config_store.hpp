#pragma once

#include <string>
#include <vector>

#include "cmdai/config.hpp"

namespace cmdai {

class ConfigStore {
 public:
  explicit ConfigStore(std::string configPath);

  // Never partial: every field is either read from the file or defaulted. Throws ConfigLoadFailure only
  // when the path itself cannot hold a config file (e.g. it is a directory).
  Config load();
  const std::vector<std::string>& load_notes() const;

  void save(const Config& config) const;

  // Validates and applies one option to `config`, then saves. Throws UnknownOption or
  // InvalidOptionValue without touching `config`; PersistenceError after applying it.
  void update(Config& config, const std::string& option, const std::string& value) const;

  const std::string& path() const;

  static const std::vector<std::string>& known_options();
  static std::string option_value(const Config& config, const std::string& option);

 private:
  std::string m_configPath;
  std::vector<std::string> m_loadNotes;
};

}  // namespace cmdai
