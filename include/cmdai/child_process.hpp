#pragma once

#include <sys/types.h>

namespace cmdai {

// Owns a forked child. A child that was never waited for is killed and reaped on destruction.
class ChildProcess {
 public:
  explicit ChildProcess(pid_t pid);
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  pid_t pid() const;

  // Blocks until the child exits and returns its raw wait status. Throws ExecutionError.
  int wait();

 private:
  pid_t m_pid;
  bool m_reaped{false};
};

}  // namespace cmdai
