#ifndef MSGATE_GATEWAY_CONSOLE_PROMPT_H
#define MSGATE_GATEWAY_CONSOLE_PROMPT_H

#include <iosfwd>
#include <string>

#include "operator_prompt.h"

namespace msgate::gateway {

// Terminal prompt on stdin/stdout. Echo is turned off for passwords when
// stdin is a tty.
class ConsolePrompt : public OperatorPrompt {
 public:
  ConsolePrompt();
  ConsolePrompt(std::istream& in, std::ostream& out);

  std::string ReadLine(const std::string& prompt) override;
  std::string ReadPassword(const std::string& prompt) override;
  void Print(const std::string& text) override;

 private:
  std::istream& in_;
  std::ostream& out_;
  bool interactive_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_CONSOLE_PROMPT_H
