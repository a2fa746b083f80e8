#pragma once

#include <string>

namespace cmdai {

enum class LogLevel {
  Debug,
  Info,
  Warn,
  Off,
};

void set_log_level(LogLevel level);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);

}  // namespace cmdai
