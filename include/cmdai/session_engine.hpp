#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "cmdai/command_runner.hpp"
#include "cmdai/config.hpp"
#include "cmdai/config_store.hpp"
#include "cmdai/console.hpp"
#include "cmdai/history_store.hpp"
#include "cmdai/inference_client.hpp"
#include "cmdai/types.hpp"

namespace cmdai {

enum class SessionState {
  Idle,
  AwaitingInput,
  ExecutingDirective,
  QueryingBackend,
  RenderingResult,
  Confirming,
  Executing,
  Exited,
};

enum class SessionMode {
  Interactive,
  OneShot,
};

std::string session_state_to_string(SessionState state);

// Process exit statuses for one-shot runs.
constexpr int kExitOk = 0;
constexpr int kExitFatal = 1;
constexpr int kExitUsage = 2;
constexpr int kExitBackendUnreachable = 3;
constexpr int kExitBackendTimeout = 4;
constexpr int kExitExecutionError = 5;

class SessionEngine {
 public:
  static constexpr char kDirectiveMarker = '!';
  static constexpr std::size_t kHistoryDisplayLimit = 10;

  SessionEngine(Config config, ConfigStore&& configStore, HistoryStore&& historyStore,
                InferenceClient&& client, ICommandRunner& runner, IConsole& console);

  int run_interactive();
  int run_once(const std::string& query);

  // Dispatches one line of input. Returns false once the session has exited.
  bool handle_line(const std::string& line);

  void show_help();
  void show_history();
  void clear_history();
  void configure();

  SessionState state() const;
  SessionMode mode() const;
  bool busy() const;
  const std::optional<CommandSuggestion>& last_suggestion() const;
  const Config& config() const;
  const HistoryStore& history() const;

 private:
  Config m_config;
  ConfigStore m_configStore;
  HistoryStore m_historyStore;
  InferenceClient m_client;
  ICommandRunner& m_runner;
  IConsole& m_console;

  SessionState m_state{SessionState::Idle};
  SessionMode m_mode{SessionMode::Interactive};
  bool m_busy{false};
  std::optional<CommandSuggestion> m_lastSuggestion;

  bool run_directive(const std::string& directive);
  int run_query(const std::string& query);
  CommandSuggestion await_suggestion(const std::string& query);
  int offer_execution(const CommandSuggestion& suggestion);
  void set_config_option(const std::string& option, const std::string& value);
  void show_config();
};

}  // namespace cmdai
