#include "cmdai/session_engine.hpp"

#include <chrono>
#include <ctime>
#include <future>
#include <iomanip>
#include <sstream>

#include "cmdai/command_extract.hpp"
#include "cmdai/errors.hpp"

namespace cmdai {
namespace {

constexpr auto kBusyTick = std::chrono::milliseconds(100);
constexpr const char* kPrompt = "cmd-ai> ";
constexpr const char* kRule = "-------------------------------------------";

std::string format_epoch(long long epoch) {
  if (epoch <= 0) {
    return "unknown";
  }
  const std::time_t raw = static_cast<std::time_t>(epoch);
  std::tm tm{};
  localtime_r(&raw, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return out.str();
}

std::string shorten(const std::string& value, std::size_t maxLen) {
  if (value.size() <= maxLen) {
    return value;
  }
  if (maxLen < 4) {
    return value.substr(0, maxLen);
  }
  return value.substr(0, maxLen - 3) + "...";
}

std::string strip_trailing_newlines(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
    text.pop_back();
  }
  return text;
}

// Keeps the busy flag and the console indicator in step, including when the query throws.
class BusyScope {
 public:
  BusyScope(bool& flag, IConsole& console) : m_flag(flag), m_console(console) {
    m_flag = true;
    m_console.set_busy(true);
  }
  ~BusyScope() {
    m_flag = false;
    m_console.set_busy(false);
  }
  BusyScope(const BusyScope&) = delete;
  BusyScope& operator=(const BusyScope&) = delete;

 private:
  bool& m_flag;
  IConsole& m_console;
};

}  // namespace

std::string session_state_to_string(SessionState state) {
  switch (state) {
    case SessionState::Idle:
      return "idle";
    case SessionState::AwaitingInput:
      return "awaiting-input";
    case SessionState::ExecutingDirective:
      return "executing-directive";
    case SessionState::QueryingBackend:
      return "querying-backend";
    case SessionState::RenderingResult:
      return "rendering-result";
    case SessionState::Confirming:
      return "confirming";
    case SessionState::Executing:
      return "executing";
    case SessionState::Exited:
      return "exited";
  }
  return "idle";
}

SessionEngine::SessionEngine(Config config, ConfigStore&& configStore, HistoryStore&& historyStore,
                             InferenceClient&& client, ICommandRunner& runner, IConsole& console)
    : m_config(std::move(config)),
      m_configStore(std::move(configStore)),
      m_historyStore(std::move(historyStore)),
      m_client(std::move(client)),
      m_runner(runner),
      m_console(console) {}

int SessionEngine::run_interactive() {
  m_mode = SessionMode::Interactive;
  m_console.print_notice("Command AI - Ask for bash commands (type !help for help)");
  m_console.print("Using model: " + m_config.m_model + " (" + m_config.m_url + ")");
  m_console.print("");

  while (m_state != SessionState::Exited) {
    m_state = SessionState::AwaitingInput;
    const std::optional<std::string> line = m_console.read_line(kPrompt);
    if (!line.has_value()) {
      m_console.print("Exiting...");
      m_state = SessionState::Exited;
      break;
    }
    handle_line(*line);
  }
  return kExitOk;
}

int SessionEngine::run_once(const std::string& query) {
  m_mode = SessionMode::OneShot;
  const std::string text = trim(query);
  if (text.empty()) {
    m_console.print_error("empty query");
    m_state = SessionState::Exited;
    return kExitUsage;
  }
  const int status = run_query(text);
  m_state = SessionState::Exited;
  return status;
}

bool SessionEngine::handle_line(const std::string& line) {
  if (m_state == SessionState::Exited) {
    return false;
  }

  const std::string input = trim(line);
  if (input.empty()) {
    m_state = SessionState::AwaitingInput;
    return true;
  }

  if (input[0] == kDirectiveMarker) {
    m_state = SessionState::ExecutingDirective;
    if (!run_directive(input)) {
      m_state = SessionState::Exited;
      return false;
    }
  } else {
    run_query(input);
  }

  m_state = SessionState::AwaitingInput;
  return true;
}

bool SessionEngine::run_directive(const std::string& directive) {
  const std::size_t split = directive.find_first_of(" \t");
  const std::string name = to_lower(directive.substr(0, split));
  const std::string args = split == std::string::npos ? "" : trim(directive.substr(split));

  if (name == "!quit" || name == "!exit") {
    m_console.print_notice("Goodbye!");
    return false;
  }
  if (name == "!help") {
    show_help();
  } else if (name == "!history") {
    show_history();
  } else if (name == "!clear") {
    clear_history();
  } else if (name == "!config") {
    if (args.empty()) {
      configure();
    } else if (to_lower(args) == "show") {
      show_config();
    } else {
      const std::size_t valueStart = args.find_first_of(" \t");
      if (valueStart == std::string::npos) {
        m_console.print_error("usage: !config <option> <value>  (options: model, url, backend_type, "
                              "prompt_prefix, auto_run_prompt, timeout_seconds)");
      } else {
        set_config_option(args.substr(0, valueStart), trim(args.substr(valueStart)));
      }
    }
  } else {
    m_console.print_error("unknown directive: " + name + " (type !help for the list)");
  }
  return true;
}

int SessionEngine::run_query(const std::string& query) {
  m_state = SessionState::QueryingBackend;

  CommandSuggestion suggestion;
  try {
    suggestion = await_suggestion(query);
  } catch (const BackendTimeout& ex) {
    m_console.print_error(std::string("request timed out: ") + ex.what());
    return kExitBackendTimeout;
  } catch (const BackendUnreachable& ex) {
    m_console.print_error(std::string("backend unreachable: ") + ex.what());
    return kExitBackendUnreachable;
  } catch (const std::exception& ex) {
    m_console.print_error(ex.what());
    return kExitFatal;
  }

  m_state = SessionState::RenderingResult;
  m_lastSuggestion = suggestion;
  m_console.print("");
  if (suggestion.m_text.empty()) {
    m_console.print_notice("(the model returned an empty response)");
  } else {
    m_console.print(suggestion.m_text);
  }
  m_console.print("");

  try {
    m_historyStore.append({HistoryStore::now_epoch(), query, suggestion.m_text});
  } catch (const PersistenceError& ex) {
    m_console.print_notice(std::string("warning: history not saved: ") + ex.what());
  }

  if (!m_config.m_autoRunPrompt || suggestion.empty()) {
    return kExitOk;
  }
  return offer_execution(suggestion);
}

CommandSuggestion SessionEngine::await_suggestion(const std::string& query) {
  BusyScope busy(m_busy, m_console);
  const std::vector<HistoryEntry> context = m_historyStore.recent(InferenceClient::kContextExchanges);
  const Config config = m_config;

  std::future<CommandSuggestion> pending = std::async(
      std::launch::async, [this, query, context, config]() { return m_client.query(query, config, context); });
  while (pending.wait_for(kBusyTick) != std::future_status::ready) {
    m_console.tick();
  }
  return pending.get();
}

int SessionEngine::offer_execution(const CommandSuggestion& suggestion) {
  m_state = SessionState::Confirming;
  m_console.print_notice(kRule);
  m_console.print("Extracted command: " + suggestion.m_command);

  const std::optional<bool> answer = m_console.confirm("Execute?");
  if (!answer.value_or(false)) {
    m_console.print_notice("Command not executed.");
    return kExitOk;
  }

  m_state = SessionState::Executing;
  m_console.print_notice(kRule);
  m_console.print_notice("Executing: " + suggestion.m_command);
  try {
    const CommandResult result = m_runner.run(suggestion.m_command);
    if (!result.m_outputShown) {
      if (result.m_truncated) {
        m_console.print_notice("(output truncated, showing the last " + std::to_string(kMaxCapturedBytes / 1024) +
                               " KiB of each stream)");
      }
      if (!result.m_stdout.empty()) {
        m_console.print(strip_trailing_newlines(result.m_stdout));
      }
      if (!result.m_stderr.empty()) {
        m_console.print(strip_trailing_newlines(result.m_stderr));
      }
    }
    if (result.m_exitCode == 0) {
      m_console.print_notice("Command finished (exit code 0)");
    } else {
      m_console.print_notice("Command failed with exit code " + std::to_string(result.m_exitCode));
    }
  } catch (const ExecutionError& ex) {
    m_console.print_error(std::string("could not execute command: ") + ex.what());
    return kExitExecutionError;
  }
  return kExitOk;
}

void SessionEngine::show_help() {
  std::ostringstream help;
  help << "This tool helps you find the right bash commands by asking an AI.\n\n";
  help << "Available commands:\n";
  help << "  !config                   Configure the tool (interactive menu)\n";
  help << "  !config show              Print the current configuration\n";
  help << "  !config <option> <value>  Set one option directly\n";
  help << "  !help                     Show this help\n";
  help << "  !history                  Show command history\n";
  help << "  !clear                    Clear command history\n";
  help << "  !quit                     Exit the tool\n\n";
  help << "Or just type your question about a bash command and press Enter.\n\n";
  help << "Command execution prompt is currently " << (m_config.m_autoRunPrompt ? "enabled" : "not enabled")
       << ".\n";
  help << "When enabled, you'll be asked whether to run each command after receiving it.\n";
  help << "You can toggle this feature in the configuration menu (!config).\n\n";
  help << "Examples:\n";
  help << "  How do I find files modified in the last 24 hours?\n";
  help << "  What's the command to check disk space usage?\n";
  help << "  How can I extract a tar.gz file?";
  m_console.print(help.str());
}

void SessionEngine::show_history() {
  const std::vector<HistoryEntry>& entries = m_historyStore.list();
  if (entries.empty()) {
    m_console.print_notice("No command history found.");
    return;
  }

  const std::size_t first = entries.size() > kHistoryDisplayLimit ? entries.size() - kHistoryDisplayLimit : 0;
  std::ostringstream out;
  out << "Command History (" << entries.size() << " total)\n";
  for (std::size_t i = first; i < entries.size(); ++i) {
    const HistoryEntry& entry = entries[i];
    out << "[" << (i + 1) << "] " << format_epoch(entry.m_timestamp) << " | " << entry.m_query << "\n";
    out << "    " << entry.m_response;
    if (i + 1 < entries.size()) {
      out << "\n";
    }
  }
  m_console.print(out.str());
}

void SessionEngine::clear_history() {
  try {
    m_historyStore.clear();
    m_console.print_notice("History cleared.");
  } catch (const PersistenceError& ex) {
    m_console.print_error(std::string("could not clear history file: ") + ex.what());
  }
}

void SessionEngine::show_config() {
  std::ostringstream out;
  out << "Command AI Configuration (" << m_configStore.path() << ")\n";
  out << "  model:           " << m_config.m_model << "\n";
  out << "  url:             " << m_config.m_url << "\n";
  out << "  backend_type:    " << backend_type_to_string(m_config.m_backendType) << "\n";
  out << "  auto_run_prompt: " << (m_config.m_autoRunPrompt ? "enabled" : "disabled") << "\n";
  out << "  timeout_seconds: " << m_config.m_timeoutSeconds << "\n";
  out << "  prompt_prefix:   " << shorten(m_config.m_promptPrefix, 50);
  m_console.print(out.str());
}

void SessionEngine::configure() {
  show_config();
  m_console.print("");
  m_console.print(
      "What would you like to change?\n"
      "  1. Model name\n"
      "  2. API URL\n"
      "  3. Prompt prefix\n"
      "  4. Request timeout (seconds)\n"
      "  5. Toggle run command prompt\n"
      "  6. Save and exit");

  const std::optional<std::string> choice = m_console.read_line("Enter your choice (1-6) [6]: ");
  if (!choice.has_value()) {
    return;
  }
  const std::string selected = trim(*choice);

  const auto ask = [this](const std::string& prompt, const std::string& current) -> std::optional<std::string> {
    const std::optional<std::string> value = m_console.read_line(prompt + " [" + shorten(current, 40) + "]: ");
    if (!value.has_value() || trim(*value).empty()) {
      return std::nullopt;
    }
    return trim(*value);
  };

  if (selected == "1") {
    if (const auto model = ask("Enter new model name", m_config.m_model); model.has_value()) {
      set_config_option("model", *model);
    }
  } else if (selected == "2") {
    if (const auto url = ask("Enter new API URL", m_config.m_url); url.has_value()) {
      set_config_option("url", *url);
    }
  } else if (selected == "3") {
    m_console.print("Current prompt prefix:\n" + m_config.m_promptPrefix);
    if (const auto prefix = ask("Enter new prompt prefix", m_config.m_promptPrefix); prefix.has_value()) {
      set_config_option("prompt_prefix", *prefix);
    }
  } else if (selected == "4") {
    if (const auto timeout = ask("Enter timeout in seconds", std::to_string(m_config.m_timeoutSeconds));
        timeout.has_value()) {
      set_config_option("timeout_seconds", *timeout);
    }
  } else if (selected == "5") {
    set_config_option("auto_run_prompt", m_config.m_autoRunPrompt ? "false" : "true");
  } else if (selected.empty() || selected == "6") {
    try {
      m_configStore.save(m_config);
      m_console.print_notice("Configuration saved");
    } catch (const PersistenceError& ex) {
      m_console.print_error(std::string("could not save configuration: ") + ex.what());
    }
  } else {
    m_console.print_error("Invalid choice: " + selected);
  }
}

void SessionEngine::set_config_option(const std::string& option, const std::string& value) {
  try {
    m_configStore.update(m_config, option, value);
    const std::string key = to_lower(trim(option));
    if (key == "auto_run_prompt") {
      m_console.print_notice(std::string("Run command prompt ") + (m_config.m_autoRunPrompt ? "enabled." : "disabled."));
    } else {
      m_console.print_notice(key + " set to " + shorten(ConfigStore::option_value(m_config, key), 60));
    }
    m_console.print_notice("Configuration saved");
  } catch (const UnknownOption& ex) {
    std::string known;
    for (const auto& name : ConfigStore::known_options()) {
      known += known.empty() ? name : ", " + name;
    }
    m_console.print_error(std::string(ex.what()) + " (known options: " + known + ")");
  } catch (const InvalidOptionValue& ex) {
    m_console.print_error(ex.what());
  } catch (const PersistenceError& ex) {
    m_console.print_error(std::string("setting applied for this session but not saved: ") + ex.what());
  }
}

SessionState SessionEngine::state() const { return m_state; }

SessionMode SessionEngine::mode() const { return m_mode; }

bool SessionEngine::busy() const { return m_busy; }

const std::optional<CommandSuggestion>& SessionEngine::last_suggestion() const { return m_lastSuggestion; }

const Config& SessionEngine::config() const { return m_config; }

const HistoryStore& SessionEngine::history() const { return m_historyStore; }

}  // namespace cmdai
