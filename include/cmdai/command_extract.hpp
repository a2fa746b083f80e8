#pragma once

#include <string>
#include <vector>

namespace cmdai {

struct CodeBlock {
  std::string m_language;
  std::string m_content;
};

std::vector<CodeBlock> extract_fenced_code_blocks(const std::string& text);
bool is_shell_language(const std::string& language);

std::string extract_command(const std::string& response);

std::string trim(const std::string& value);
std::string to_lower(std::string value);

}  // namespace cmdai
