#include "cmdai/command_runner.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <string>

#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "cmdai/child_process.hpp"
#include "cmdai/command_extract.hpp"
#include "cmdai/errors.hpp"
#include "cmdai/log.hpp"

namespace cmdai {
namespace {

class Pipe {
 public:
  Pipe() {
    if (::pipe(m_fds) != 0) {
      throw ExecutionError(std::string("failed to create pipe: ") + std::strerror(errno));
    }
  }
  ~Pipe() {
    close_read();
    close_write();
  }
  Pipe(const Pipe&) = delete;
  Pipe& operator=(const Pipe&) = delete;

  int read_end() const { return m_fds[0]; }
  int write_end() const { return m_fds[1]; }

  void close_read() {
    if (m_fds[0] >= 0) {
      ::close(m_fds[0]);
      m_fds[0] = -1;
    }
  }
  void close_write() {
    if (m_fds[1] >= 0) {
      ::close(m_fds[1]);
      m_fds[1] = -1;
    }
  }

 private:
  int m_fds[2]{-1, -1};
};

// The foreground child receives terminal interrupts; this process keeps running while it waits.
class ScopedIgnoreInterrupts {
 public:
  ScopedIgnoreInterrupts() {
    struct sigaction ignore {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    ::sigaction(SIGINT, &ignore, &m_previousInt);
    ::sigaction(SIGQUIT, &ignore, &m_previousQuit);
  }
  ~ScopedIgnoreInterrupts() {
    ::sigaction(SIGINT, &m_previousInt, nullptr);
    ::sigaction(SIGQUIT, &m_previousQuit, nullptr);
  }
  ScopedIgnoreInterrupts(const ScopedIgnoreInterrupts&) = delete;
  ScopedIgnoreInterrupts& operator=(const ScopedIgnoreInterrupts&) = delete;

 private:
  struct sigaction m_previousInt {};
  struct sigaction m_previousQuit {};
};

void write_all(int fd, const char* data, std::size_t size) {
  while (size > 0) {
    const ssize_t n = ::write(fd, data, size);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return;
    }
    data += n;
    size -= static_cast<std::size_t>(n);
  }
}

void append_capped(std::string& sink, const char* data, std::size_t size, bool& truncated) {
  sink.append(data, size);
  if (sink.size() > kMaxCapturedBytes) {
    sink.erase(0, sink.size() - kMaxCapturedBytes);
    truncated = true;
  }
}

[[noreturn]] void exec_shell(const std::string& commandText) {
  ::signal(SIGINT, SIG_DFL);
  ::signal(SIGQUIT, SIG_DFL);
  ::execl("/bin/sh", "sh", "-c", commandText.c_str(), static_cast<char*>(nullptr));
  const char* message = "cmdai: failed to exec /bin/sh\n";
  write_all(STDERR_FILENO, message, std::strlen(message));
  ::_exit(127);
}

pid_t fork_or_throw() {
  std::fflush(stdout);
  std::fflush(stderr);
  const pid_t pid = ::fork();
  if (pid < 0) {
    throw ExecutionError(std::string("failed to fork: ") + std::strerror(errno));
  }
  return pid;
}

class ShellCommandRunner final : public ICommandRunner {
 public:
  explicit ShellCommandRunner(bool passthrough) : m_passthrough(passthrough) {}

  CommandResult run(const std::string& commandText) override {
    if (trim(commandText).empty()) {
      throw ExecutionError("refusing to run an empty command");
    }
    if (commandText.find('\0') != std::string::npos) {
      throw ExecutionError("command contains a NUL byte");
    }
    return m_passthrough ? run_on_terminal(commandText) : run_captured(commandText);
  }

 private:
  bool m_passthrough;

  // The child shares this process's stdout/stderr, so pagers and full-screen programs see the terminal.
  CommandResult run_on_terminal(const std::string& commandText) const {
    ScopedIgnoreInterrupts interrupts;
    const pid_t pid = fork_or_throw();
    if (pid == 0) {
      exec_shell(commandText);
    }
    ChildProcess child(pid);
    log_debug("spawned pid " + std::to_string(pid) + " on the terminal: " + commandText);

    CommandResult result;
    result.m_exitCode = command_exit_code(child.wait());
    result.m_outputShown = true;
    return result;
  }

  CommandResult run_captured(const std::string& commandText) const {
    Pipe outPipe;
    Pipe errPipe;
    ScopedIgnoreInterrupts interrupts;

    const pid_t pid = fork_or_throw();
    if (pid == 0) {
      ::dup2(outPipe.write_end(), STDOUT_FILENO);
      ::dup2(errPipe.write_end(), STDERR_FILENO);
      ::close(outPipe.read_end());
      ::close(errPipe.read_end());
      ::close(outPipe.write_end());
      ::close(errPipe.write_end());
      exec_shell(commandText);
    }
    ChildProcess child(pid);

    outPipe.close_write();
    errPipe.close_write();
    log_debug("spawned pid " + std::to_string(pid) + ": " + commandText);

    CommandResult result;
    drain(outPipe.read_end(), errPipe.read_end(), result);
    result.m_exitCode = command_exit_code(child.wait());
    return result;
  }

  static void drain(int outFd, int errFd, CommandResult& result) {
    pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
    std::string* sinks[2] = {&result.m_stdout, &result.m_stderr};
    int openStreams = 2;
    char buffer[4096];

    while (openStreams > 0) {
      const int ready = ::poll(fds, 2, -1);
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        throw ExecutionError(std::string("failed polling command output: ") + std::strerror(errno));
      }
      for (int i = 0; i < 2; ++i) {
        if (fds[i].fd < 0 || (fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
          continue;
        }
        const ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
        if (n > 0) {
          append_capped(*sinks[i], buffer, static_cast<std::size_t>(n), result.m_truncated);
        } else if (n == 0 || errno != EINTR) {
          fds[i].fd = -1;
          --openStreams;
        }
      }
    }
  }
};

}  // namespace

int command_exit_code(int waitStatus) {
  if (WIFEXITED(waitStatus)) {
    return WEXITSTATUS(waitStatus);
  }
  if (WIFSIGNALED(waitStatus)) {
    return 128 + WTERMSIG(waitStatus);
  }
  return waitStatus;
}

std::unique_ptr<ICommandRunner> make_shell_command_runner(bool passthrough) {
  return std::make_unique<ShellCommandRunner>(passthrough);
}

}  // namespace cmdai
