#pragma once

#include <string>

namespace cmdai {

std::string home_directory();
std::string default_config_path();
std::string default_history_path();
std::string default_readline_history_path();

}  // namespace cmdai
