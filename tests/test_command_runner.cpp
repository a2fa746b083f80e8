#include <cerrno>
#include <cstdio>
#include <memory>
#include <string>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

#include "cmdai/child_process.hpp"
#include "cmdai/command_runner.hpp"
#include "cmdai/errors.hpp"
#include "test_support.hpp"

namespace cmdai_test {
namespace {

void test_exit_status_is_data() {
  std::unique_ptr<cmdai::ICommandRunner> runner = cmdai::make_shell_command_runner(false);
  const cmdai::CommandResult result = runner->run("exit 3");
  assert_true(result.m_exitCode == 3, "exit 3 should report 3");
  assert_true(!result.m_outputShown, "captured output should not be marked as shown");

  assert_true(runner->run("true").m_exitCode == 0, "true should report 0");
  assert_true(runner->run("kill -9 $$").m_exitCode == 128 + 9, "signal death should report 128+signal");
}

void test_streams_are_captured_separately() {
  std::unique_ptr<cmdai::ICommandRunner> runner = cmdai::make_shell_command_runner(false);
  const cmdai::CommandResult result = runner->run("echo out; echo err 1>&2; printf 'tail'");
  assert_true(result.m_stdout == "out\ntail", "stdout should be captured");
  assert_true(result.m_stderr == "err\n", "stderr should be captured on its own");

  const cmdai::CommandResult missing = runner->run("definitely-not-a-command-cmdai");
  assert_true(missing.m_exitCode == 127, "unknown command should report 127 from the shell");
  assert_true(!missing.m_stderr.empty(), "shell should complain on stderr");
}

void test_empty_command_is_rejected() {
  std::unique_ptr<cmdai::ICommandRunner> runner = cmdai::make_shell_command_runner(false);
  for (const std::string command : {"", "   \t\n"}) {
    bool threw = false;
    try {
      runner->run(command);
    } catch (const cmdai::ExecutionError&) {
      threw = true;
    }
    assert_true(threw, "empty command should raise ExecutionError");
  }
}

// Points this process's stdout at a file for the lifetime of the object.
class StdoutToFile {
 public:
  explicit StdoutToFile(const std::string& path) {
    std::fflush(stdout);
    m_saved = ::dup(STDOUT_FILENO);
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    ::dup2(fd, STDOUT_FILENO);
    ::close(fd);
  }
  ~StdoutToFile() {
    std::fflush(stdout);
    ::dup2(m_saved, STDOUT_FILENO);
    ::close(m_saved);
  }
  StdoutToFile(const StdoutToFile&) = delete;
  StdoutToFile& operator=(const StdoutToFile&) = delete;

 private:
  int m_saved{-1};
};

void test_passthrough_writes_to_inherited_stdout() {
  const std::string dir = make_temp_dir("cmdai-runner-");
  const std::string path = dir + "/stdout.txt";
  std::unique_ptr<cmdai::ICommandRunner> runner = cmdai::make_shell_command_runner(true);

  cmdai::CommandResult result;
  cmdai::CommandResult failed;
  {
    StdoutToFile redirect(path);
    result = runner->run("echo on-terminal; test -p /dev/stdout && echo piped; true");
    failed = runner->run("exit 4");
  }
  assert_true(read_file(path) == "on-terminal\n", "passthrough output should land on this process's stdout");
  assert_true(result.m_stdout.empty() && result.m_stderr.empty(), "passthrough should capture nothing");
  assert_true(result.m_outputShown, "passthrough output should be marked as shown");
  assert_true(result.m_exitCode == 0, "passthrough should report the exit code");
  assert_true(failed.m_exitCode == 4, "passthrough should report a non-zero exit code");

  fs::remove_all(dir);
}

void test_captured_output_is_capped() {
  std::unique_ptr<cmdai::ICommandRunner> runner = cmdai::make_shell_command_runner(false);
  const cmdai::CommandResult big = runner->run("head -c 3000000 /dev/zero; printf end");
  assert_true(big.m_stdout.size() == cmdai::kMaxCapturedBytes, "captured stdout should stop at the cap");
  assert_true(big.m_stdout.substr(big.m_stdout.size() - 3) == "end", "the tail of the output should be kept");
  assert_true(big.m_truncated, "capped output should be flagged as truncated");

  const cmdai::CommandResult small = runner->run("echo small");
  assert_true(!small.m_truncated, "small output should not be flagged");
}

void test_unwaited_child_is_killed_and_reaped() {
  pid_t pid = ::fork();
  assert_true(pid >= 0, "fork should succeed");
  if (pid == 0) {
    ::execl("/bin/sleep", "sleep", "30", static_cast<char*>(nullptr));
    ::_exit(127);
  }
  { cmdai::ChildProcess child(pid); }
  errno = 0;
  assert_true(::waitpid(pid, nullptr, WNOHANG) == -1 && errno == ECHILD,
              "an abandoned child should already be reaped");

  pid = ::fork();
  assert_true(pid >= 0, "fork should succeed");
  if (pid == 0) {
    ::_exit(6);
  }
  cmdai::ChildProcess waited(pid);
  assert_true(cmdai::command_exit_code(waited.wait()) == 6, "wait should return the child's status");
}

void test_exit_code_decoding() {
  assert_true(cmdai::command_exit_code(0) == 0, "zero wait status is exit 0");
  assert_true(cmdai::command_exit_code(2 << 8) == 2, "exited status should decode");
}

}  // namespace

void run_command_runner_tests() {
  test_exit_status_is_data();
  test_streams_are_captured_separately();
  test_empty_command_is_rejected();
  test_passthrough_writes_to_inherited_stdout();
  test_captured_output_is_capped();
  test_unwaited_child_is_killed_and_reaped();
  test_exit_code_decoding();
}

}  // namespace cmdai_test
