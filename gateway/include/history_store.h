#ifndef MSGATE_GATEWAY_HISTORY_STORE_H
#define MSGATE_GATEWAY_HISTORY_STORE_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "contact_directory.h"
#include "gateway_error.h"

namespace msgate::gateway {

enum class Direction : std::uint8_t { kOutbound = 0, kInbound = 1 };

struct HistoryEntry {
  std::uint64_t timestamp{0};  // unix seconds
  Direction direction{Direction::kOutbound};
  std::string body;
};

constexpr std::size_t kDefaultHistoryLimit = 10u * 1024u;

const char* DirectionMarker(Direction direction);

// "<Mon DD HH:MM> <marker> <body>\n". Line breaks inside the body are
// flattened to spaces so that one entry is always one line.
std::string FormatHistoryLine(const HistoryEntry& entry);

// Per-contact append-only conversation logs.
class HistoryStore {
 public:
  explicit HistoryStore(std::size_t tail_limit = kDefaultHistoryLimit);

  // One write(2) per entry on an O_APPEND descriptor; concurrent appends
  // to the same log never split a line.
  bool Append(const ContactRecord& contact, const HistoryEntry& entry,
              GatewayError& error) const;

  bool ReadTail(const ContactRecord& contact, std::string& out,
                GatewayError& error) const;
  bool ReadTail(const ContactRecord& contact, std::size_t max_bytes,
                std::string& out, GatewayError& error) const;

  std::size_t tail_limit() const { return tail_limit_; }

 private:
  std::size_t tail_limit_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_HISTORY_STORE_H
