#include "cmdai/config_store.hpp"

#include <filesystem>
#include <limits>
#include <optional>

#include "cmdai/command_extract.hpp"
#include "cmdai/errors.hpp"
#include "cmdai/json_file.hpp"
#include "cmdai/log.hpp"

namespace cmdai {
namespace {

constexpr const char* kModel = "model";
constexpr const char* kUrl = "url";
constexpr const char* kBackendType = "backend_type";
constexpr const char* kLegacyBackendType = "type";
constexpr const char* kPromptPrefix = "prompt_prefix";
constexpr const char* kAutoRunPrompt = "auto_run_prompt";
constexpr const char* kTimeoutSeconds = "timeout_seconds";

// The legacy "type" key is not listed: it stays with the extras so a save writes it back.
bool is_schema_key(const std::string& key) {
  for (const auto& option : ConfigStore::known_options()) {
    if (option == key) {
      return true;
    }
  }
  return false;
}

void require_utf8(const std::string& option, const std::string& value) {
  if (!is_valid_utf8(value)) {
    throw InvalidOptionValue(option + " must be valid UTF-8 text");
  }
}

void read_string_field(const nlohmann::json& object, const char* key, std::string& field,
                       std::vector<std::string>& notes) {
  const auto it = object.find(key);
  if (it == object.end()) {
    return;
  }
  if (!it->is_string() || it->get<std::string>().empty()) {
    notes.push_back(std::string("invalid '") + key + "' in config; using default");
    return;
  }
  field = it->get<std::string>();
}

nlohmann::json to_json(const Config& config) {
  nlohmann::json out = config.m_extra.is_object() ? config.m_extra : nlohmann::json::object();
  out[kModel] = config.m_model;
  out[kUrl] = config.m_url;
  out[kBackendType] = backend_type_to_string(config.m_backendType);
  out[kPromptPrefix] = config.m_promptPrefix;
  out[kAutoRunPrompt] = config.m_autoRunPrompt;
  out[kTimeoutSeconds] = config.m_timeoutSeconds;
  if (out.contains(kLegacyBackendType)) {
    out[kLegacyBackendType] = backend_type_to_string(config.m_backendType);
  }
  return out;
}

Config from_json(const nlohmann::json& object, std::vector<std::string>& notes) {
  Config config;

  read_string_field(object, kModel, config.m_model, notes);

  std::string url = config.m_url;
  read_string_field(object, kUrl, url, notes);
  std::string urlError;
  if (is_valid_http_url(url, urlError)) {
    config.m_url = url;
  } else {
    notes.push_back("invalid 'url' in config (" + urlError + "); using default");
  }

  const char* backendKey = object.contains(kBackendType) ? kBackendType : kLegacyBackendType;
  if (const auto it = object.find(backendKey); it != object.end()) {
    BackendType type = config.m_backendType;
    if (it->is_string() && backend_type_from_string(it->get<std::string>(), type)) {
      config.m_backendType = type;
    } else {
      notes.push_back("unsupported backend type '" + (it->is_string() ? it->get<std::string>() : it->dump()) +
                      "' in config; using ollama");
    }
  }

  read_string_field(object, kPromptPrefix, config.m_promptPrefix, notes);

  if (const auto it = object.find(kAutoRunPrompt); it != object.end()) {
    if (it->is_boolean()) {
      config.m_autoRunPrompt = it->get<bool>();
    } else {
      notes.push_back("invalid 'auto_run_prompt' in config; using default");
    }
  }

  if (const auto it = object.find(kTimeoutSeconds); it != object.end()) {
    if (it->is_number_integer() && it->get<long long>() > 0 &&
        it->get<long long>() <= std::numeric_limits<long>::max()) {
      config.m_timeoutSeconds = static_cast<long>(it->get<long long>());
    } else {
      notes.push_back("invalid 'timeout_seconds' in config; using default");
    }
  }

  for (auto it = object.begin(); it != object.end(); ++it) {
    if (!is_schema_key(it.key())) {
      config.m_extra[it.key()] = it.value();
    }
  }
  return config;
}

}  // namespace

ConfigStore::ConfigStore(std::string configPath) : m_configPath(std::move(configPath)) {}

Config ConfigStore::load() {
  m_loadNotes.clear();

  std::error_code ec;
  if (std::filesystem::is_directory(m_configPath, ec)) {
    throw ConfigLoadFailure("config path is a directory: " + m_configPath);
  }

  std::optional<nlohmann::json> document;
  try {
    document = read_json_file(m_configPath);
  } catch (const nlohmann::json::parse_error& ex) {
    m_loadNotes.push_back("error loading config " + m_configPath + ": " + ex.what() + "; using defaults");
  } catch (const PersistenceError& ex) {
    m_loadNotes.push_back(std::string(ex.what()) + "; using defaults");
  }

  if (!document.has_value()) {
    if (m_loadNotes.empty()) {
      log_debug("no config file at " + m_configPath + "; using defaults");
    }
    for (const auto& note : m_loadNotes) {
      log_warn(note);
    }
    return Config{};
  }

  if (!document->is_object()) {
    m_loadNotes.push_back("config " + m_configPath + " is not a JSON object; using defaults");
    log_warn(m_loadNotes.back());
    return Config{};
  }

  Config config = from_json(*document, m_loadNotes);
  for (const auto& note : m_loadNotes) {
    log_warn(note);
  }
  return config;
}

const std::vector<std::string>& ConfigStore::load_notes() const { return m_loadNotes; }

void ConfigStore::save(const Config& config) const {
  write_json_file(m_configPath, to_json(config));
  log_debug("saved config to " + m_configPath);
}

void ConfigStore::update(Config& config, const std::string& option, const std::string& value) const {
  const std::string key = to_lower(trim(option));
  Config next = config;

  if (key == kModel) {
    const std::string model = trim(value);
    if (model.empty()) {
      throw InvalidOptionValue("model must not be empty");
    }
    require_utf8(key, model);
    next.m_model = model;
  } else if (key == kUrl) {
    const std::string url = trim(value);
    require_utf8(key, url);
    std::string error;
    if (!is_valid_http_url(url, error)) {
      throw InvalidOptionValue("invalid url '" + url + "': " + error);
    }
    next.m_url = url;
  } else if (key == kBackendType) {
    BackendType type = next.m_backendType;
    if (!backend_type_from_string(value, type)) {
      throw InvalidOptionValue("unsupported backend type: " + value + " (supported: ollama)");
    }
    next.m_backendType = type;
  } else if (key == kPromptPrefix) {
    if (trim(value).empty()) {
      throw InvalidOptionValue("prompt_prefix must not be empty");
    }
    require_utf8(key, value);
    next.m_promptPrefix = value;
  } else if (key == kAutoRunPrompt) {
    bool enabled = false;
    if (!parse_bool(value, enabled)) {
      throw InvalidOptionValue("auto_run_prompt expects true or false, got: " + value);
    }
    next.m_autoRunPrompt = enabled;
  } else if (key == kTimeoutSeconds) {
    long seconds = 0;
    try {
      std::size_t consumed = 0;
      seconds = std::stol(trim(value), &consumed);
      if (consumed != trim(value).size()) {
        seconds = 0;
      }
    } catch (const std::exception&) {
      seconds = 0;
    }
    if (seconds <= 0) {
      throw InvalidOptionValue("timeout_seconds expects a positive integer, got: " + value);
    }
    next.m_timeoutSeconds = seconds;
  } else {
    throw UnknownOption(option);
  }

  config = std::move(next);
  save(config);
  log_info("config option " + key + " updated");
}

const std::string& ConfigStore::path() const { return m_configPath; }

const std::vector<std::string>& ConfigStore::known_options() {
  static const std::vector<std::string> options = {kModel,         kUrl,          kBackendType,
                                                   kPromptPrefix,  kAutoRunPrompt, kTimeoutSeconds};
  return options;
}

std::string ConfigStore::option_value(const Config& config, const std::string& option) {
  const std::string key = to_lower(trim(option));
  if (key == kModel) {
    return config.m_model;
  }
  if (key == kUrl) {
    return config.m_url;
  }
  if (key == kBackendType) {
    return backend_type_to_string(config.m_backendType);
  }
  if (key == kPromptPrefix) {
    return config.m_promptPrefix;
  }
  if (key == kAutoRunPrompt) {
    return config.m_autoRunPrompt ? "true" : "false";
  }
  if (key == kTimeoutSeconds) {
    return std::to_string(config.m_timeoutSeconds);
  }
  throw UnknownOption(option);
}

}  // namespace cmdai
