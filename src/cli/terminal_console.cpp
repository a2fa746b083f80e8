#include "cmdai/console.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

#include <readline/history.h>
#include <readline/readline.h>
#include <signal.h>
#include <unistd.h>

#include "cmdai/command_extract.hpp"
#include "cmdai/log.hpp"

namespace cmdai {
namespace {

constexpr const char* kReset = "\033[0m";
constexpr const char* kPromptColor = "\033[1;32m";
constexpr const char* kNoticeColor = "\033[38;5;214m";
constexpr const char* kErrorColor = "\033[1;38;5;203m";
constexpr const char* kSpinnerColor = "\033[38;5;75m";
constexpr const char* kSpinnerFrames[] = {"|", "/", "-", "\\"};
constexpr int kReadlineHistoryLimit = 500;

volatile std::sig_atomic_t g_interrupted = 0;

void on_interrupt(int) { g_interrupted = 1; }

// Readline calls this after a signal interrupts its read; ending the line hands control back to read_line.
int finish_line_on_interrupt() {
  if (g_interrupted != 0) {
    rl_done = 1;
  }
  return 0;
}

// Readline needs non-printing sequences bracketed to compute the prompt width.
std::string readline_safe(const std::string& prompt) {
  std::string out;
  out.reserve(prompt.size() + 8);
  bool inEscape = false;
  for (std::size_t i = 0; i < prompt.size(); ++i) {
    const char c = prompt[i];
    if (c == '\033' && !inEscape) {
      out.push_back('\001');
      inEscape = true;
    }
    out.push_back(c);
    if (inEscape && c == 'm') {
      out.push_back('\002');
      inEscape = false;
    }
  }
  return out;
}

class TerminalConsole final : public IConsole {
 public:
  explicit TerminalConsole(std::string historyPath)
      : m_historyPath(std::move(historyPath)), m_colors(::isatty(STDOUT_FILENO) != 0) {
    g_interrupted = 0;
    struct sigaction interrupt {};
    interrupt.sa_handler = on_interrupt;
    sigemptyset(&interrupt.sa_mask);
    ::sigaction(SIGINT, &interrupt, &m_previousInt);
    rl_signal_event_hook = finish_line_on_interrupt;

    using_history();
    stifle_history(kReadlineHistoryLimit);
    if (!m_historyPath.empty()) {
      const int rc = read_history(m_historyPath.c_str());
      if (rc != 0 && rc != ENOENT) {
        log_debug("could not read readline history " + m_historyPath + ": " + std::strerror(rc));
      }
    }
  }

  ~TerminalConsole() override {
    if (m_busy) {
      clear_spinner();
    }
    if (!m_historyPath.empty() && m_historyDirty) {
      const int rc = write_history(m_historyPath.c_str());
      if (rc != 0) {
        log_warn("could not write readline history " + m_historyPath + ": " + std::strerror(rc));
      }
    }
    rl_signal_event_hook = nullptr;
    ::sigaction(SIGINT, &m_previousInt, nullptr);
  }

  void print(const std::string& text) override { std::cout << text << "\n" << std::flush; }

  void print_notice(const std::string& text) override {
    std::cout << color(kNoticeColor) << text << color(kReset) << "\n" << std::flush;
  }

  void print_error(const std::string& text) override {
    std::cout << color(kErrorColor) << "error: " << color(kReset) << text << "\n" << std::flush;
  }

  // Ctrl-C ends input the same way end-of-file does.
  std::optional<std::string> read_line(const std::string& prompt) override {
    if (g_interrupted != 0) {
      return std::nullopt;
    }
    char* raw = readline(readline_safe(color(kPromptColor) + prompt + color(kReset)).c_str());
    if (raw == nullptr || g_interrupted != 0) {
      std::free(raw);
      std::cout << "\n";
      return std::nullopt;
    }
    std::string line(raw);
    std::free(raw);
    if (!trim(line).empty()) {
      add_history(line.c_str());
      m_historyDirty = true;
    }
    return line;
  }

  std::optional<bool> confirm(const std::string& question) override {
    const std::string prompt = question + " " + color("\033[38;5;120m") + "y" + color(kReset) + "/" +
                               color("\033[38;5;203m") + "n" + color(kReset) + " [n]: ";
    while (g_interrupted == 0) {
      char* raw = readline(readline_safe(prompt).c_str());
      if (raw == nullptr || g_interrupted != 0) {
        std::free(raw);
        std::cout << "\n";
        return std::nullopt;
      }
      const std::string answer = to_lower(trim(raw));
      std::free(raw);
      if (answer == "y" || answer == "yes") {
        return true;
      }
      if (answer.empty() || answer == "n" || answer == "no") {
        return false;
      }
      std::cout << "please answer y or n\n";
    }
    return std::nullopt;
  }

  void set_busy(bool busy) override {
    if (busy == m_busy) {
      return;
    }
    m_busy = busy;
    m_frame = 0;
    if (busy) {
      tick();
    } else {
      clear_spinner();
    }
  }

  void tick() override {
    if (!m_busy || !m_colors) {
      return;
    }
    const std::size_t frameCount = sizeof(kSpinnerFrames) / sizeof(kSpinnerFrames[0]);
    std::cout << "\r" << kSpinnerColor << kSpinnerFrames[m_frame % frameCount] << kReset << " Thinking..."
              << std::flush;
    ++m_frame;
  }

 private:
  std::string m_historyPath;
  bool m_colors;
  struct sigaction m_previousInt {};
  bool m_historyDirty{false};
  bool m_busy{false};
  std::size_t m_frame{0};

  std::string color(const char* code) const { return m_colors ? code : ""; }

  void clear_spinner() const {
    if (m_colors) {
      std::cout << "\r\033[K" << std::flush;
    }
  }
};

}  // namespace

std::unique_ptr<IConsole> make_terminal_console(std::string readlineHistoryPath) {
  return std::make_unique<TerminalConsole>(std::move(readlineHistoryPath));
}

}  // namespace cmdai
