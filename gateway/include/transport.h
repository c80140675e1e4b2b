#ifndef MSGATE_GATEWAY_TRANSPORT_H
#define MSGATE_GATEWAY_TRANSPORT_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <vector>

namespace msgate::gateway {

struct TransportConfig {
  std::string tel;
  std::string verification_type{"sms"};
  std::filesystem::path storage_dir;
  std::string log_level{"error"};
};

// Callbacks a transport invokes synchronously from Setup().
class TransportHooks {
 public:
  virtual ~TransportHooks() = default;

  virtual std::string VerificationCode() = 0;
  // Key storage already sits on the encrypted volume; implementations
  // return an empty password.
  virtual std::string StoragePassword() = 0;
  virtual void RegistrationDone() = 0;
};

struct InboundAttachment {
  std::string content_type;
  std::unique_ptr<std::istream> data;
};

struct InboundMessage {
  std::string source;
  std::string body;
  std::uint64_t timestamp{0};  // unix seconds
  std::vector<InboundAttachment> attachments;
};

using InboundHandler = std::function<void(const InboundMessage& message)>;

// Secure messaging client. Protocol, key agreement and envelope encryption
// live behind this interface.
class Transport {
 public:
  virtual ~Transport() = default;

  // Registers and provisions keys when needed, then prepares the session.
  virtual bool Setup(const TransportConfig& config, TransportHooks& hooks,
                     std::string& error) = 0;

  virtual bool Send(const std::string& number, const std::string& text,
                    std::string& error) = 0;
  virtual bool SendAttachment(const std::string& number,
                              const std::string& text,
                              std::istream& attachment,
                              std::string& error) = 0;

  // Blocks delivering messages to `handler` until `stop` is set (returns
  // true) or the transport fails (returns false with `error`).
  virtual bool Listen(const InboundHandler& handler,
                      const std::atomic<bool>& stop, std::string& error) = 0;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_TRANSPORT_H
