#include "cmdai/command_extract.hpp"

#include <algorithm>
#include <array>
#include <sstream>

namespace cmdai {
namespace {

constexpr std::size_t kMaxProseLineLength = 120;

bool starts_with(const std::string& text, const std::string& prefix) { return text.rfind(prefix, 0) == 0; }

bool contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

bool looks_like_explanation(const std::string& line) {
  static const std::array<const char*, 10> kExplanationPrefixes = {
      "to ", "this ", "you ", "the ", "here", "use ", "if ", "note:", "note that", "it "};

  const std::string lower = to_lower(line);
  for (const char* prefix : kExplanationPrefixes) {
    if (starts_with(lower, prefix)) {
      return true;
    }
  }
  if (line[0] == '#') {
    return true;
  }
  if (line.size() > kMaxProseLineLength && contains(line, " ") && !contains(line, "&&") &&
      !contains(line, "||")) {
    return true;
  }
  const auto dots = std::count(line.begin(), line.end(), '.');
  const auto commas = std::count(line.begin(), line.end(), ',');
  if ((dots > 2 || commas > 2) && !contains(line, "find ") && !contains(line, "grep ")) {
    return true;
  }
  return false;
}

bool looks_like_command(const std::string& line) {
  static const std::array<const char*, 6> kOperators = {" | ", ";", ">", "<", "&&", "||"};
  static const std::array<const char*, 19> kCommandPrefixes = {
      "$", "sudo", "./", "apt", "git", "docker", "kubectl", "find", "grep", "ls",
      "cat", "cd", "mkdir", "rm", "cp", "mv", "df", "du", "ps"};

  for (const char* op : kOperators) {
    if (contains(line, op)) {
      return true;
    }
  }
  for (const char* prefix : kCommandPrefixes) {
    if (starts_with(line, prefix)) {
      return true;
    }
  }
  return false;
}

std::string strip_prompt_marker(const std::string& line) {
  if (!line.empty() && line[0] == '$') {
    return trim(line.substr(1));
  }
  return line;
}

}  // namespace

std::string trim(const std::string& value) {
  const auto start = value.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

std::string to_lower(std::string value) {
  for (char& c : value) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return value;
}

bool is_shell_language(const std::string& language) {
  const std::string lang = to_lower(trim(language));
  return lang == "sh" || lang == "bash" || lang == "zsh" || lang == "shell" || lang == "console";
}

std::vector<CodeBlock> extract_fenced_code_blocks(const std::string& text) {
  std::vector<CodeBlock> out;
  std::size_t pos = 0;
  while (true) {
    const std::size_t fenceStart = text.find("```", pos);
    if (fenceStart == std::string::npos) {
      break;
    }
    const std::size_t bodyStart = fenceStart + 3;
    const std::size_t fenceEnd = text.find("```", bodyStart);
    if (fenceEnd == std::string::npos) {
      break;
    }

    const std::size_t langEnd = text.find('\n', bodyStart);
    if (langEnd == std::string::npos || langEnd > fenceEnd) {
      // Single-line fence: ```ls -la```
      out.push_back({"", text.substr(bodyStart, fenceEnd - bodyStart)});
    } else {
      const std::string language = text.substr(bodyStart, langEnd - bodyStart);
      out.push_back({trim(language), text.substr(langEnd + 1, fenceEnd - (langEnd + 1))});
    }
    pos = fenceEnd + 3;
  }
  return out;
}

std::string extract_command(const std::string& response) {
  const std::vector<CodeBlock> blocks = extract_fenced_code_blocks(response);
  for (const auto& block : blocks) {
    if (is_shell_language(block.m_language)) {
      return trim(block.m_content);
    }
  }
  if (!blocks.empty()) {
    return trim(blocks.front().m_content);
  }

  std::vector<std::string> commandLines;
  std::vector<std::string> candidateLines;
  std::istringstream in(response);
  std::string raw;
  while (std::getline(in, raw)) {
    const std::string line = trim(raw);
    if (line.empty() || looks_like_explanation(line)) {
      continue;
    }
    candidateLines.push_back(line);
    if (looks_like_command(line)) {
      commandLines.push_back(strip_prompt_marker(line));
    }
  }

  if (!commandLines.empty()) {
    return commandLines.front();
  }
  if (!candidateLines.empty()) {
    return candidateLines.front();
  }

  std::istringstream again(response);
  while (std::getline(again, raw)) {
    if (!trim(raw).empty()) {
      return trim(raw);
    }
  }
  return trim(response);
}

}  // namespace cmdai
