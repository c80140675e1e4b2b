#ifndef MSGATE_GATEWAY_SPOOL_TRANSPORT_H
#define MSGATE_GATEWAY_SPOOL_TRANSPORT_H

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>

#include "transport.h"

namespace msgate::gateway {

// Directory-spool transport. Outbound messages are written as envelope
// files to <spool>/outbox; inbound envelopes dropped into <spool>/inbox are
// delivered to the listener and removed.
//
// Envelope: "Header: value" lines, an empty line, then the body.
//   To / From        peer number
//   Timestamp        unix seconds (inbound, optional)
//   Attachment       file name beside the envelope, optional content type
//                    after a space
class SpoolTransport : public Transport {
 public:
  SpoolTransport(std::filesystem::path spool_dir,
                 std::uint32_t poll_interval_ms);

  bool Setup(const TransportConfig& config, TransportHooks& hooks,
             std::string& error) override;

  bool Send(const std::string& number, const std::string& text,
            std::string& error) override;
  bool SendAttachment(const std::string& number, const std::string& text,
                      std::istream& attachment, std::string& error) override;

  bool Listen(const InboundHandler& handler, const std::atomic<bool>& stop,
              std::string& error) override;

  const std::filesystem::path& outbox_dir() const { return outbox_dir_; }
  const std::filesystem::path& inbox_dir() const { return inbox_dir_; }

 private:
  bool Provision(const TransportConfig& config, TransportHooks& hooks,
                 std::string& error);
  bool WriteEnvelope(const std::string& number, const std::string& text,
                     const std::string& attachment_name, std::string& error);
  bool NewSpoolId(std::string& out, std::string& error) const;
  bool DeliverInbox(const InboundHandler& handler, std::string& error);
  bool DeliverEnvelope(const std::filesystem::path& path,
                       const InboundHandler& handler, std::string& error);

  std::filesystem::path spool_dir_;
  std::filesystem::path outbox_dir_;
  std::filesystem::path inbox_dir_;
  std::uint32_t poll_interval_ms_;
  std::atomic<bool> ready_{false};
  std::mutex mutex_;
  std::string tel_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_SPOOL_TRANSPORT_H
