#ifndef MSGATE_GATEWAY_OPERATOR_PROMPT_H
#define MSGATE_GATEWAY_OPERATOR_PROMPT_H

#include <string>

namespace msgate::gateway {

// Interactive operator I/O used during registration.
class OperatorPrompt {
 public:
  virtual ~OperatorPrompt() = default;

  virtual std::string ReadLine(const std::string& prompt) = 0;
  // Input is not echoed.
  virtual std::string ReadPassword(const std::string& prompt) = 0;
  virtual void Print(const std::string& text) = 0;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_OPERATOR_PROMPT_H
