#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "cmdai/backend.hpp"
#include "cmdai/command_runner.hpp"
#include "cmdai/config_store.hpp"
#include "cmdai/console.hpp"
#include "cmdai/errors.hpp"
#include "cmdai/history_store.hpp"
#include "cmdai/inference_client.hpp"
#include "cmdai/session_engine.hpp"
#include "test_support.hpp"

namespace cmdai_test {
namespace {

class ScriptedConsole final : public cmdai::IConsole {
 public:
  std::deque<std::string> m_lines;
  std::deque<bool> m_answers;
  std::vector<std::string> m_output;
  std::vector<std::string> m_prompts;
  int m_confirmCalls{0};
  int m_busyOn{0};
  int m_busyOff{0};

  void print(const std::string& text) override { m_output.push_back(text); }
  void print_notice(const std::string& text) override { m_output.push_back(text); }
  void print_error(const std::string& text) override { m_output.push_back("error: " + text); }

  std::optional<std::string> read_line(const std::string& prompt) override {
    m_prompts.push_back(prompt);
    if (m_lines.empty()) {
      return std::nullopt;
    }
    std::string line = m_lines.front();
    m_lines.pop_front();
    return line;
  }

  std::optional<bool> confirm(const std::string&) override {
    ++m_confirmCalls;
    if (m_answers.empty()) {
      return std::nullopt;
    }
    const bool answer = m_answers.front();
    m_answers.pop_front();
    return answer;
  }

  void set_busy(bool busy) override { ++(busy ? m_busyOn : m_busyOff); }

  std::string transcript() const {
    std::string all;
    for (const auto& line : m_output) {
      all += line + "\n";
    }
    return all;
  }

  bool printed(const std::string& needle) const { return transcript().find(needle) != std::string::npos; }
};

class FakeRunner final : public cmdai::ICommandRunner {
 public:
  std::vector<std::string> m_commands;
  int m_exitCode{0};
  bool m_fail{false};
  bool m_truncated{false};

  cmdai::CommandResult run(const std::string& commandText) override {
    m_commands.push_back(commandText);
    if (m_fail) {
      throw cmdai::ExecutionError("fork failed");
    }
    cmdai::CommandResult result;
    result.m_exitCode = m_exitCode;
    result.m_stdout = "fake output\n";
    result.m_truncated = m_truncated;
    return result;
  }
};

struct BackendScript {
  std::function<std::string(const cmdai::InferenceRequest&)> m_reply;
  std::vector<cmdai::InferenceRequest> m_requests;
};

class ScriptedBackend final : public cmdai::IInferenceBackend {
 public:
  explicit ScriptedBackend(std::shared_ptr<BackendScript> script) : m_script(std::move(script)) {}
  std::string name() const override { return "scripted"; }
  std::string complete(const cmdai::InferenceRequest& request) override {
    m_script->m_requests.push_back(request);
    return m_script->m_reply(request);
  }

 private:
  std::shared_ptr<BackendScript> m_script;
};

// Owns everything a SessionEngine borrows, rooted in a fresh temp directory.
struct Fixture {
  std::string m_dir;
  std::shared_ptr<BackendScript> m_script = std::make_shared<BackendScript>();
  ScriptedConsole m_console;
  FakeRunner m_runner;
  std::unique_ptr<cmdai::SessionEngine> m_engine;

  explicit Fixture(bool autoRunPrompt = true, const std::string& reply = "find . -type f -size +10M") {
    m_dir = make_temp_dir("cmdai-session-");
    m_script->m_reply = [reply](const cmdai::InferenceRequest&) { return reply; };

    cmdai::Config config;
    config.m_autoRunPrompt = autoRunPrompt;
    cmdai::HistoryStore history(history_path());
    history.load();
    m_engine = std::make_unique<cmdai::SessionEngine>(
        config, cmdai::ConfigStore(config_path()), std::move(history),
        cmdai::InferenceClient(std::make_unique<ScriptedBackend>(m_script)), m_runner, m_console);
  }

  ~Fixture() {
    m_engine.reset();
    fs::remove_all(m_dir);
  }

  std::string config_path() const { return m_dir + "/config.json"; }
  std::string history_path() const { return m_dir + "/history.json"; }
};

void test_query_renders_and_executes_after_confirmation() {
  Fixture fx;
  fx.m_console.m_answers.push_back(true);
  fx.m_runner.m_exitCode = 2;

  const int status = fx.m_engine->run_once("find large files");
  assert_true(status == cmdai::kExitOk, "successful one-shot should exit 0 even if the command fails");
  assert_true(fx.m_engine->mode() == cmdai::SessionMode::OneShot, "run_once should use one-shot mode");
  assert_true(fx.m_engine->state() == cmdai::SessionState::Exited, "one-shot should end in Exited");
  assert_true(fx.m_console.printed("find . -type f -size +10M"), "suggestion should be rendered verbatim");
  assert_true(fx.m_console.m_confirmCalls == 1, "confirmation should be requested once");
  assert_true(fx.m_runner.m_commands.size() == 1 && fx.m_runner.m_commands[0] == "find . -type f -size +10M",
              "runner should execute the extracted command");
  assert_true(fx.m_console.printed("fake output"), "captured output should be rendered");
  assert_true(fx.m_console.printed("exit code 2"), "exit code should be reported");
  assert_true(fx.m_engine->history().list().size() == 1, "query should be recorded in history");
  assert_true(fx.m_engine->history().list()[0].m_query == "find large files", "history should keep the query");
  assert_true(fx.m_console.m_busyOn == 1 && fx.m_console.m_busyOff == 1, "busy indicator should toggle once");
  assert_true(!fx.m_engine->busy(), "busy flag should be cleared after the query");
  assert_true(fx.m_engine->last_suggestion().has_value(), "last suggestion should be kept");
}

void test_declined_or_unanswered_confirmation() {
  Fixture fx;
  fx.m_console.m_answers.push_back(false);
  assert_true(fx.m_engine->run_once("find large files") == cmdai::kExitOk, "declining is still success");
  assert_true(fx.m_runner.m_commands.empty(), "declined command must not run");
  assert_true(fx.m_console.printed("Command not executed."), "decline should be reported");

  Fixture eof;
  assert_true(eof.m_engine->run_once("find large files") == cmdai::kExitOk, "no answer is still success");
  assert_true(eof.m_runner.m_commands.empty(), "unanswered confirmation must not run the command");
}

void test_auto_run_disabled_never_confirms() {
  Fixture fx(false);
  fx.m_console.m_lines = {"find large files", "list files", "!quit"};
  assert_true(fx.m_engine->run_interactive() == cmdai::kExitOk, "interactive session should exit 0");
  assert_true(fx.m_console.m_confirmCalls == 0, "no confirmation when auto_run_prompt is off");
  assert_true(fx.m_runner.m_commands.empty(), "nothing should run when auto_run_prompt is off");
  assert_true(fx.m_engine->history().list().size() == 2, "both queries should be recorded");
}

void test_backend_failures_map_to_exit_codes() {
  Fixture refused;
  refused.m_script->m_reply = [](const cmdai::InferenceRequest&) -> std::string {
    throw cmdai::BackendUnreachable("connection error: Connection refused");
  };
  assert_true(refused.m_engine->run_once("list files") == cmdai::kExitBackendUnreachable,
              "unreachable backend should exit 3");
  assert_true(refused.m_console.printed("error: backend unreachable"), "unreachable error should be rendered");
  assert_true(refused.m_engine->history().list().empty(), "failed query must not be recorded");
  assert_true(refused.m_console.m_busyOff == 1 && !refused.m_engine->busy(), "busy should clear on failure");

  Fixture slow;
  slow.m_script->m_reply = [](const cmdai::InferenceRequest&) -> std::string {
    throw cmdai::BackendTimeout("backend did not respond within 1s");
  };
  assert_true(slow.m_engine->run_once("list files") == cmdai::kExitBackendTimeout, "timeout should exit 4");
  assert_true(slow.m_engine->history().list().empty(), "timed out query must not be recorded");

  Fixture broken;
  broken.m_console.m_answers.push_back(true);
  broken.m_runner.m_fail = true;
  assert_true(broken.m_engine->run_once("find large files") == cmdai::kExitExecutionError,
              "execution failure should exit 5");
  assert_true(broken.m_console.printed("could not execute command"), "execution error should be rendered");
}

void test_failed_query_in_interactive_mode_keeps_session() {
  Fixture fx;
  fx.m_script->m_reply = [](const cmdai::InferenceRequest&) -> std::string {
    throw cmdai::BackendUnreachable("connection error: Connection refused");
  };
  assert_true(fx.m_engine->handle_line("list files"), "session should continue after a backend error");
  assert_true(fx.m_engine->state() == cmdai::SessionState::AwaitingInput, "engine should await input again");
  assert_true(fx.m_engine->history().list().empty(), "failed query must not be recorded");
  assert_true(!fx.m_engine->last_suggestion().has_value(), "failed query leaves no suggestion");
}

void test_history_directive() {
  Fixture empty;
  empty.m_engine->handle_line("!history");
  assert_true(empty.m_console.printed("No command history found."), "empty history should say so");

  Fixture fx(false);
  fx.m_script->m_reply = [](const cmdai::InferenceRequest& request) -> std::string {
    return request.m_userText == "list files" ? "ls -la" : "df -h";
  };
  fx.m_engine->handle_line("list files");
  fx.m_engine->handle_line("show disk usage");
  fx.m_console.m_output.clear();

  fx.m_engine->handle_line("!history");
  const std::string out = fx.m_console.transcript();
  const std::size_t first = out.find("list files");
  const std::size_t second = out.find("show disk usage");
  assert_true(first != std::string::npos && second != std::string::npos, "both entries should be shown");
  assert_true(first < second, "entries should be shown oldest first");
  assert_true(out.find("ls -la") != std::string::npos && out.find("df -h") != std::string::npos,
              "responses should be shown");
  assert_true(out.find("[1] ") != std::string::npos && out.find("[2] ") != std::string::npos,
              "entries should be numbered");
  assert_true(fx.m_script->m_requests.size() == 2, "the history directive never reaches the backend");
}

void test_history_shows_last_ten_by_absolute_position() {
  Fixture fx(false);
  for (int i = 1; i <= 12; ++i) {
    fx.m_engine->handle_line("query " + std::to_string(i));
  }
  fx.m_console.m_output.clear();
  fx.m_engine->handle_line("!history");
  assert_true(!fx.m_console.printed("[1] "), "oldest entries beyond ten should be hidden");
  assert_true(!fx.m_console.printed("[2] "), "second entry should be hidden");
  assert_true(fx.m_console.printed("[3] "), "third entry should be the first shown");
  assert_true(fx.m_console.printed("[12] "), "newest entry should be shown");
  assert_true(fx.m_console.printed("query 12"), "newest query should be shown");
}

void test_clear_directive() {
  Fixture fx(false);
  fx.m_engine->handle_line("list files");
  fx.m_engine->handle_line("!clear");
  assert_true(fx.m_engine->history().list().empty(), "clear should empty history");
  assert_true(fx.m_console.printed("History cleared."), "clear should be confirmed");

  cmdai::HistoryStore reloaded(fx.history_path());
  reloaded.load();
  assert_true(reloaded.list().empty(), "cleared history should be persisted");
}

void test_context_is_sent_with_queries() {
  Fixture fx(false);
  fx.m_engine->handle_line("list files");
  fx.m_engine->handle_line("now sorted by size");
  assert_true(fx.m_script->m_requests.size() == 2, "two backend calls expected");
  assert_true(fx.m_script->m_requests[0].m_context.empty(), "first query has no context");
  assert_true(fx.m_script->m_requests[1].m_context.size() == 1, "second query should carry the first exchange");
  assert_true(fx.m_script->m_requests[1].m_context[0].m_query == "list files", "context should hold the query");
}

void test_directive_dispatch() {
  Fixture fx;
  assert_true(fx.m_engine->handle_line("   "), "blank input should keep the session");
  assert_true(fx.m_engine->handle_line("!frobnicate"), "unknown directive should keep the session");
  assert_true(fx.m_console.printed("error: unknown directive: !frobnicate"), "unknown directive is an error");
  assert_true(fx.m_script->m_requests.empty(), "directives and blanks never reach the backend");

  fx.m_engine->handle_line("!help");
  assert_true(fx.m_console.printed("!history"), "help should list directives");
  assert_true(fx.m_console.printed("currently enabled"), "help should show the run prompt status");

  assert_true(!fx.m_engine->handle_line("!QUIT"), "quit should end the session");
  assert_true(fx.m_engine->state() == cmdai::SessionState::Exited, "quit should reach Exited");
  assert_true(!fx.m_engine->handle_line("list files"), "exited session ignores input");

  Fixture other;
  assert_true(!other.m_engine->handle_line("!exit"), "exit is an alias of quit");
}

void test_config_directive() {
  Fixture fx;
  fx.m_engine->handle_line("!config model llama3:8b");
  assert_true(fx.m_engine->config().m_model == "llama3:8b", "config directive should update the model");
  cmdai::ConfigStore store(fx.config_path());
  assert_true(store.load().m_model == "llama3:8b", "config change should be saved");

  fx.m_engine->handle_line("!config colour blue");
  assert_true(fx.m_console.printed("error: unknown option: colour"), "unknown option should be reported");
  fx.m_engine->handle_line("!config timeout_seconds soon");
  assert_true(fx.m_engine->config().m_timeoutSeconds == 60, "invalid value should leave config unchanged");

  fx.m_console.m_output.clear();
  fx.m_engine->handle_line("!config show");
  assert_true(fx.m_console.printed("llama3:8b"), "config show should print the model");

  fx.m_console.m_lines = {"5"};
  fx.m_engine->handle_line("!config");
  assert_true(!fx.m_engine->config().m_autoRunPrompt, "menu option 5 should toggle the run prompt");
  assert_true(!store.load().m_autoRunPrompt, "toggle should be saved");

  fx.m_console.m_lines = {"1", "qwen2.5-coder"};
  fx.m_engine->handle_line("!config");
  assert_true(fx.m_engine->config().m_model == "qwen2.5-coder", "menu option 1 should change the model");

  fx.m_console.m_lines = {"9"};
  fx.m_engine->handle_line("!config");
  assert_true(fx.m_console.printed("Invalid choice"), "bad menu choice should be reported");
}

void test_config_directive_rejects_non_utf8_value() {
  Fixture fx;
  assert_true(fx.m_engine->handle_line("!config model caf\xe9"), "a bad byte in a value should keep the session");
  assert_true(fx.m_console.printed("UTF-8"), "the rejection should be reported");
  assert_true(fx.m_engine->config().m_model == "phi4:latest", "the model should be unchanged");
  assert_true(fx.m_engine->state() == cmdai::SessionState::AwaitingInput, "engine should await input again");
  assert_true(!fs::exists(fx.config_path()), "nothing should be written for a rejected value");

  fx.m_console.m_lines = {"1", "caf\xe9"};
  assert_true(fx.m_engine->handle_line("!config"), "the menu should survive a bad byte too");
  assert_true(fx.m_engine->config().m_model == "phi4:latest", "the menu should leave the model unchanged");

  assert_true(fx.m_engine->handle_line("!config model llama3"), "a later valid update should work");
  assert_true(fx.m_engine->config().m_model == "llama3", "the later update should apply");
  for (const auto& entry : fs::directory_iterator(fx.m_dir)) {
    assert_true(entry.path().filename() == "config.json", "no temp file should be left behind");
  }
}

void test_non_utf8_query_is_recorded() {
  Fixture fx(false);
  assert_true(fx.m_engine->handle_line("find caf\xe9 files"), "a bad byte in a query should keep the session");
  assert_true(fx.m_engine->history().list().size() == 1, "the query should be recorded");
  cmdai::HistoryStore reloaded(fx.history_path());
  reloaded.load();
  assert_true(reloaded.list().size() == 1, "the query should reach the history file");
}

void test_prompt_is_plain_text() {
  Fixture fx;
  fx.m_console.m_lines = {"!quit"};
  fx.m_engine->run_interactive();
  assert_true(!fx.m_console.m_prompts.empty(), "the prompt should be shown");
  assert_true(fx.m_console.m_prompts[0] == "cmd-ai> ", "the prompt should carry no terminal escapes");
}

void test_truncated_output_is_flagged() {
  Fixture fx;
  fx.m_console.m_answers.push_back(true);
  fx.m_runner.m_truncated = true;
  fx.m_engine->run_once("find large files");
  assert_true(fx.m_console.printed("output truncated"), "capped output should be announced");

  Fixture whole;
  whole.m_console.m_answers.push_back(true);
  whole.m_engine->run_once("find large files");
  assert_true(!whole.m_console.printed("output truncated"), "complete output should not be announced");
}

void test_interactive_loop_ends_on_eof() {
  Fixture fx;
  fx.m_console.m_lines = {"!help", "list files"};
  fx.m_console.m_answers.push_back(false);
  assert_true(fx.m_engine->run_interactive() == cmdai::kExitOk, "eof should end the session cleanly");
  assert_true(fx.m_engine->mode() == cmdai::SessionMode::Interactive, "run_interactive uses interactive mode");
  assert_true(fx.m_engine->state() == cmdai::SessionState::Exited, "eof should reach Exited");
  assert_true(fx.m_console.printed("Using model: phi4:latest"), "banner should name the model");
  assert_true(fx.m_console.m_prompts.size() == 3, "prompt should be shown until eof");
  assert_true(fx.m_engine->history().list().size() == 1, "the query should be recorded");
}

void test_empty_one_shot_query_is_usage_error() {
  Fixture fx;
  assert_true(fx.m_engine->run_once("   ") == cmdai::kExitUsage, "blank one-shot query is a usage error");
  assert_true(fx.m_script->m_requests.empty(), "blank query never reaches the backend");
}

}  // namespace

void run_session_engine_tests() {
  test_query_renders_and_executes_after_confirmation();
  test_declined_or_unanswered_confirmation();
  test_auto_run_disabled_never_confirms();
  test_backend_failures_map_to_exit_codes();
  test_failed_query_in_interactive_mode_keeps_session();
  test_history_directive();
  test_history_shows_last_ten_by_absolute_position();
  test_clear_directive();
  test_context_is_sent_with_queries();
  test_directive_dispatch();
  test_config_directive();
  test_config_directive_rejects_non_utf8_value();
  test_non_utf8_query_is_recorded();
  test_prompt_is_plain_text();
  test_truncated_output_is_flagged();
  test_interactive_loop_ends_on_eof();
  test_empty_one_shot_query_is_usage_error();
}

}  // namespace cmdai_test
