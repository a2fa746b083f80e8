#include "cmdai/child_process.hpp"

#include <cerrno>
#include <cstring>
#include <string>

#include <signal.h>
#include <sys/wait.h>

#include "cmdai/errors.hpp"
#include "cmdai/log.hpp"

namespace cmdai {

ChildProcess::ChildProcess(pid_t pid) : m_pid(pid) {}

ChildProcess::~ChildProcess() {
  if (m_reaped || m_pid <= 0) {
    return;
  }
  log_debug("killing unreaped child " + std::to_string(m_pid));
  ::kill(m_pid, SIGKILL);
  int status = 0;
  while (::waitpid(m_pid, &status, 0) < 0 && errno == EINTR) {
  }
}

pid_t ChildProcess::pid() const { return m_pid; }

int ChildProcess::wait() {
  int status = 0;
  while (::waitpid(m_pid, &status, 0) < 0) {
    if (errno != EINTR) {
      throw ExecutionError(std::string("failed waiting for command: ") + std::strerror(errno));
    }
  }
  m_reaped = true;
  return status;
}

}  // namespace cmdai
