#pragma once

#include <memory>
#include <optional>
#include <string>

namespace cmdai {

class IConsole {
 public:
  virtual ~IConsole() = default;

  virtual void print(const std::string& text) = 0;
  virtual void print_notice(const std::string& text) = 0;
  virtual void print_error(const std::string& text) = 0;

  // std::nullopt on end of input.
  virtual std::optional<std::string> read_line(const std::string& prompt) = 0;
  virtual std::optional<bool> confirm(const std::string& question) = 0;

  virtual void set_busy(bool busy) = 0;
  // Called periodically while busy so the implementation can animate.
  virtual void tick() {}
};

std::unique_ptr<IConsole> make_terminal_console(std::string readlineHistoryPath);

}  // namespace cmdai
