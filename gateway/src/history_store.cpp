#include "history_store.h"

#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

#include "platform_fs.h"
#include "platform_time.h"

namespace msgate::gateway {

const char* DirectionMarker(Direction direction) {
  return direction == Direction::kInbound ? "<" : ">";
}

std::string FormatHistoryLine(const HistoryEntry& entry) {
  std::string line = platform::FormatLocalMinute(entry.timestamp);
  line.push_back(' ');
  line.append(DirectionMarker(entry.direction));
  line.push_back(' ');
  for (const char ch : entry.body) {
    line.push_back((ch == '\n' || ch == '\r') ? ' ' : ch);
  }
  line.push_back('\n');
  return line;
}

HistoryStore::HistoryStore(std::size_t tail_limit)
    : tail_limit_(tail_limit == 0 ? kDefaultHistoryLimit : tail_limit) {}

bool HistoryStore::Append(const ContactRecord& contact,
                          const HistoryEntry& entry,
                          GatewayError& error) const {
  if (contact.history_path.empty()) {
    error.Set(ErrorCode::kInvalidContact, "contact has no history path");
    return false;
  }
  const std::string line = FormatHistoryLine(entry);
  std::error_code ec;
  if (!platform::fs::AppendAll(
          contact.history_path,
          reinterpret_cast<const std::uint8_t*>(line.data()), line.size(),
          ec)) {
    error.Set(ErrorCode::kStorageFailure,
              "history append failed: " + ec.message());
    return false;
  }
  return true;
}

bool HistoryStore::ReadTail(const ContactRecord& contact, std::string& out,
                            GatewayError& error) const {
  return ReadTail(contact, tail_limit_, out, error);
}

bool HistoryStore::ReadTail(const ContactRecord& contact,
                            std::size_t max_bytes, std::string& out,
                            GatewayError& error) const {
  out.clear();
  std::error_code ec;
  const std::uint64_t size = platform::fs::FileSize(contact.history_path, ec);
  if (ec) {
    error.Set(ErrorCode::kStorageFailure,
              "history not found: " + ec.message());
    return false;
  }

  std::ifstream ifs(contact.history_path, std::ios::binary);
  if (!ifs) {
    error.Set(ErrorCode::kStorageFailure, "history open failed");
    return false;
  }

  const bool truncated = size > max_bytes;
  if (truncated) {
    ifs.seekg(static_cast<std::streamoff>(size - max_bytes), std::ios::beg);
    if (!ifs) {
      error.Set(ErrorCode::kStorageFailure, "history seek failed");
      return false;
    }
  }

  std::string content((std::istreambuf_iterator<char>(ifs)),
                      std::istreambuf_iterator<char>());
  if (ifs.bad()) {
    error.Set(ErrorCode::kStorageFailure, "history read failed");
    return false;
  }

  if (truncated) {
    // Drop the partial first line; keep everything when there is no
    // line feed at all.
    const auto lf = content.find('\n');
    if (lf != std::string::npos) {
      content.erase(0, lf + 1);
    }
  }
  out = std::move(content);
  return true;
}

}  // namespace msgate::gateway
