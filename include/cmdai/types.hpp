#pragma once

#include <string>
#include <vector>

namespace cmdai {

enum class Role {
  System,
  User,
  Assistant,
};

std::string role_to_string(Role role);

struct HistoryEntry {
  long long m_timestamp{0};
  std::string m_query;
  std::string m_response;
};

struct InferenceRequest {
  std::string m_model;
  std::string m_url;
  std::string m_systemPrompt;
  std::string m_userText;
  std::vector<HistoryEntry> m_context;
  long m_timeoutSeconds{60};
};

// m_text is the trimmed model response as rendered; m_command is what would be run.
struct CommandSuggestion {
  std::string m_text;
  std::string m_command;

  bool empty() const { return m_command.empty(); }
};

struct CommandResult {
  int m_exitCode{0};
  std::string m_stdout;
  std::string m_stderr;
  bool m_outputShown{false};
  bool m_truncated{false};
};

}  // namespace cmdai
