#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "cmdai/backend.hpp"
#include "cmdai/command_runner.hpp"
#include "cmdai/config_store.hpp"
#include "cmdai/console.hpp"
#include "cmdai/history_store.hpp"
#include "cmdai/inference_client.hpp"
#include "cmdai/log.hpp"
#include "cmdai/paths.hpp"
#include "cmdai/session_engine.hpp"

namespace {

constexpr const char* kVersion = "0.3.0";

enum class Action {
  Session,
  Configure,
  ShowHistory,
  ClearHistory,
};

void print_usage(std::ostream& out) {
  out << "usage: cmdai [options] [query words...]\n"
         "\n"
         "Ask a local model for a shell command. Without query words an interactive session starts.\n"
         "\n"
         "options:\n"
         "  --config          open the configuration menu\n"
         "  --history         print the command history\n"
         "  --clear-history   delete the command history\n"
         "  --verbose         log debug output to stderr\n"
         "  --version         print the version\n"
         "  -h, --help        show this help\n"
         "\n"
         "environment:\n"
         "  CMDAI_CONFIG      config file (default ~/.cmd_ai_config.json)\n"
         "  CMDAI_HISTORY     history file (default ~/.cmd_ai_history.json)\n"
         "  CMDAI_DEBUG=1     same as --verbose\n";
}

bool env_flag(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr && std::string(value) == "1";
}

}  // namespace

int main(int argc, char** argv) {
  Action action = Action::Session;
  std::vector<std::string> words;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (!words.empty() || arg.empty() || arg[0] != '-') {
      words.push_back(arg);
    } else if (arg == "--") {
      for (++i; i < argc; ++i) {
        words.push_back(argv[i]);
      }
    } else if (arg == "--help" || arg == "-h") {
      print_usage(std::cout);
      return cmdai::kExitOk;
    } else if (arg == "--version") {
      std::cout << "cmdai " << kVersion << "\n";
      return cmdai::kExitOk;
    } else if (arg == "--verbose") {
      cmdai::set_log_level(cmdai::LogLevel::Debug);
    } else if (arg == "--config") {
      action = Action::Configure;
    } else if (arg == "--history") {
      action = Action::ShowHistory;
    } else if (arg == "--clear-history") {
      action = Action::ClearHistory;
    } else {
      std::cerr << "cmdai: unknown option " << arg << "\n";
      print_usage(std::cerr);
      return cmdai::kExitUsage;
    }
  }
  if (env_flag("CMDAI_DEBUG")) {
    cmdai::set_log_level(cmdai::LogLevel::Debug);
  }

  try {
    cmdai::ConfigStore configStore(cmdai::default_config_path());
    cmdai::Config config = configStore.load();

    cmdai::HistoryStore historyStore(cmdai::default_history_path());
    historyStore.load();

    cmdai::InferenceClient client(cmdai::make_backend(config.m_backendType));
    std::unique_ptr<cmdai::ICommandRunner> runner = cmdai::make_shell_command_runner(true);
    std::unique_ptr<cmdai::IConsole> console =
        cmdai::make_terminal_console(action == Action::Session && words.empty()
                                         ? cmdai::default_readline_history_path()
                                         : std::string());

    cmdai::SessionEngine engine(std::move(config), std::move(configStore), std::move(historyStore),
                                std::move(client), *runner, *console);

    switch (action) {
      case Action::Configure:
        engine.configure();
        return cmdai::kExitOk;
      case Action::ShowHistory:
        engine.show_history();
        return cmdai::kExitOk;
      case Action::ClearHistory:
        engine.clear_history();
        return cmdai::kExitOk;
      case Action::Session:
        break;
    }

    if (words.empty()) {
      return engine.run_interactive();
    }
    std::string query;
    for (const auto& word : words) {
      query += query.empty() ? word : " " + word;
    }
    return engine.run_once(query);
  } catch (const std::exception& ex) {
    std::cerr << "fatal: " << ex.what() << "\n";
    return cmdai::kExitFatal;
  }
}
