#pragma once

#include <cstddef>
#include <memory>
#include <string>

#include "cmdai/types.hpp"

namespace cmdai {

// Captured output keeps at most this many trailing bytes per stream.
constexpr std::size_t kMaxCapturedBytes = 1 << 20;

class ICommandRunner {
 public:
  virtual ~ICommandRunner() = default;

  // Non-zero exit codes are returned, not thrown. Throws ExecutionError when nothing could be spawned.
  virtual CommandResult run(const std::string& commandText) = 0;
};

// With passthrough the command writes straight to this process's stdout/stderr and nothing is captured.
std::unique_ptr<ICommandRunner> make_shell_command_runner(bool passthrough);

int command_exit_code(int waitStatus);

}  // namespace cmdai
