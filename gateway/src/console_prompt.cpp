#include "console_prompt.h"

#include <termios.h>
#include <unistd.h>

#include <iostream>
#include <utility>

namespace msgate::gateway {

namespace {

std::string StripLineEnd(std::string line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
    line.pop_back();
  }
  return line;
}

}  // namespace

ConsolePrompt::ConsolePrompt()
    : in_(std::cin),
      out_(std::cout),
      interactive_(::isatty(STDIN_FILENO) != 0) {}

ConsolePrompt::ConsolePrompt(std::istream& in, std::ostream& out)
    : in_(in), out_(out), interactive_(false) {}

std::string ConsolePrompt::ReadLine(const std::string& prompt) {
  out_ << prompt << std::flush;
  std::string line;
  if (!std::getline(in_, line)) {
    return {};
  }
  return StripLineEnd(std::move(line));
}

std::string ConsolePrompt::ReadPassword(const std::string& prompt) {
  out_ << prompt << std::flush;
  termios old_attr{};
  bool restore = false;
  if (interactive_ && ::tcgetattr(STDIN_FILENO, &old_attr) == 0) {
    termios no_echo = old_attr;
    no_echo.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    restore = ::tcsetattr(STDIN_FILENO, TCSANOW, &no_echo) == 0;
  }
  std::string line;
  const bool got = static_cast<bool>(std::getline(in_, line));
  if (restore) {
    ::tcsetattr(STDIN_FILENO, TCSANOW, &old_attr);
  }
  out_ << "\n" << std::flush;
  if (!got) {
    return {};
  }
  return StripLineEnd(std::move(line));
}

void ConsolePrompt::Print(const std::string& text) { out_ << text << std::flush; }

}  // namespace msgate::gateway
