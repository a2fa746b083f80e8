#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace cmdai {

enum class BackendType {
  Ollama,
};

std::string backend_type_to_string(BackendType type);
bool backend_type_from_string(const std::string& value, BackendType& out);

struct Config {
  std::string m_model{"phi4:latest"};
  std::string m_url{"http://localhost:11434/api/generate"};
  BackendType m_backendType{BackendType::Ollama};
  std::string m_promptPrefix{
      "You are a helpful assistant that provides accurate bash commands for Linux. "
      "Be concise and only output the command, unless the user specifically asks for explanation."};
  bool m_autoRunPrompt{true};
  long m_timeoutSeconds{60};

  // Keys found in the file that are not part of the schema, written back untouched.
  nlohmann::json m_extra = nlohmann::json::object();

  bool operator==(const Config& other) const;
  bool operator!=(const Config& other) const { return !(*this == other); }
};

bool is_valid_http_url(const std::string& url, std::string& error);
bool is_valid_utf8(const std::string& value);
bool parse_bool(const std::string& value, bool& out);

// Older config files store the API base (".../api"); requests against it go to ".../api/chat".
std::string resolve_endpoint_url(const std::string& url);

}  // namespace cmdai
