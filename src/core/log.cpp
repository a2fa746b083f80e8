#include "cmdai/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace cmdai {
namespace {

std::atomic<LogLevel> g_level{LogLevel::Warn};
std::mutex g_writeMutex;

void write_line(LogLevel level, const char* tag, const std::string& message) {
  if (static_cast<int>(level) < static_cast<int>(g_level.load())) {
    return;
  }
  // The inference call logs from a worker thread.
  std::lock_guard<std::mutex> lock(g_writeMutex);
  std::cerr << "[" << tag << "] " << message << "\n";
}

}  // namespace

void set_log_level(LogLevel level) { g_level.store(level); }

void log_debug(const std::string& message) { write_line(LogLevel::Debug, "debug", message); }

void log_info(const std::string& message) { write_line(LogLevel::Info, "info", message); }

void log_warn(const std::string& message) { write_line(LogLevel::Warn, "warn", message); }

}  // namespace cmdai
