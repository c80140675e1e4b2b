#include "history_store.h"

#include <string>
#include <thread>
#include <vector>

#include "platform_time.h"
#include "test_support.h"

using msgate::gateway::ContactRecord;
using msgate::gateway::Direction;
using msgate::gateway::ErrorCode;
using msgate::gateway::FormatHistoryLine;
using msgate::gateway::GatewayError;
using msgate::gateway::HistoryEntry;
using msgate::gateway::HistoryStore;
using msgate::gateway::test::Check;
using msgate::gateway::test::EndsWith;
using msgate::gateway::test::ReadFile;
using msgate::gateway::test::SplitLines;
using msgate::gateway::test::StartsWith;
using msgate::gateway::test::TempDir;
using msgate::gateway::test::WriteFile;

namespace {

ContactRecord MakeContact(const std::filesystem::path& dir) {
  ContactRecord contact;
  contact.display_name = "Alice";
  contact.number = "+15550001";
  contact.history_path = dir / "Alice +15550001.textsecure";
  return contact;
}

}  // namespace

int main() {
  {
    HistoryEntry entry;
    entry.timestamp = 1700000000;
    entry.direction = Direction::kOutbound;
    entry.body = "two\nlines\r";
    const std::string line = FormatHistoryLine(entry);
    const std::string stamp = msgate::platform::FormatLocalMinute(1700000000);
    if (!Check(stamp.size() == 12 && StartsWith(line, stamp + " > ") &&
               EndsWith(line, "two lines \n"))) {
      return 1;
    }
    entry.direction = Direction::kInbound;
    if (!Check(FormatHistoryLine(entry).find(" < ") == stamp.size())) {
      return 1;
    }
  }

  {
    const auto dir = TempDir("msgate_history_missing");
    HistoryStore store;
    std::string out;
    GatewayError err;
    if (!Check(!store.ReadTail(MakeContact(dir), out, err) &&
               err.code == ErrorCode::kStorageFailure)) {
      return 1;
    }
  }

  {
    const auto dir = TempDir("msgate_history_boundary");
    const auto contact = MakeContact(dir);
    HistoryStore store(64);
    const std::string line(15, 'x');
    const std::string exact = line + "\n" + line + "\n" + line + "\n" + line +
                              "\n";
    WriteFile(contact.history_path, exact);
    std::string out;
    GatewayError err;
    if (!Check(store.ReadTail(contact, out, err) && out == exact)) {
      return 1;
    }

    // One byte over: the first line is partial and dropped.
    WriteFile(contact.history_path, "z" + exact);
    if (!Check(store.ReadTail(contact, out, err) &&
               out == exact.substr(16))) {
      return 1;
    }

    std::string again;
    if (!Check(store.ReadTail(contact, again, err) && again == out &&
               ReadFile(contact.history_path).size() == exact.size() + 1)) {
      return 1;
    }
  }

  {
    const auto dir = TempDir("msgate_history_no_newline");
    const auto contact = MakeContact(dir);
    HistoryStore store(8);
    WriteFile(contact.history_path, std::string(20, 'y'));
    std::string out;
    GatewayError err;
    if (!Check(store.ReadTail(contact, out, err) &&
               out == std::string(8, 'y'))) {
      return 1;
    }
  }

  {
    const auto dir = TempDir("msgate_history_concurrent");
    const auto contact = MakeContact(dir);
    HistoryStore store;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 50;
    std::vector<std::thread> workers;
    std::vector<int> failures(kThreads, 0);
    for (int t = 0; t < kThreads; ++t) {
      workers.emplace_back([&store, &contact, &failures, t]() {
        for (int i = 0; i < kPerThread; ++i) {
          HistoryEntry entry;
          entry.timestamp = 1700000000;
          entry.direction = t % 2 == 0 ? Direction::kOutbound
                                       : Direction::kInbound;
          entry.body = "thread-" + std::to_string(t) + "-msg-" +
                       std::to_string(i) + std::string(100, '.');
          GatewayError err;
          if (!store.Append(contact, entry, err)) {
            ++failures[t];
          }
        }
      });
    }
    for (auto& w : workers) {
      w.join();
    }
    for (int f : failures) {
      if (!Check(f == 0)) {
        return 1;
      }
    }
    const auto lines = SplitLines(ReadFile(contact.history_path));
    if (!Check(lines.size() == kThreads * kPerThread)) {
      return 1;
    }
    const std::string stamp = msgate::platform::FormatLocalMinute(1700000000);
    for (const auto& line : lines) {
      const bool marker_ok = StartsWith(line, stamp + " > thread-") ||
                             StartsWith(line, stamp + " < thread-");
      if (!Check(marker_ok && EndsWith(line, std::string(100, '.')))) {
        return 1;
      }
    }
  }

  {
    // 50 KiB of history read back through the default 10 KiB window.
    const auto dir = TempDir("msgate_history_large");
    const auto contact = MakeContact(dir);
    HistoryStore store;
    GatewayError err;
    std::string last_line;
    std::size_t written = 0;
    for (int i = 0; written < 50u * 1024u; ++i) {
      HistoryEntry entry;
      entry.timestamp = 1700000000 + static_cast<std::uint64_t>(i);
      entry.direction = Direction::kInbound;
      entry.body = "message number " + std::to_string(i) +
                   std::string(40 + i % 17, '-');
      if (!store.Append(contact, entry, err)) {
        return 1;
      }
      last_line = FormatHistoryLine(entry);
      written += last_line.size();
    }
    const std::string full = ReadFile(contact.history_path);
    std::string out;
    if (!Check(store.ReadTail(contact, out, err))) {
      return 1;
    }
    if (!Check(!out.empty() && out.size() <= 10u * 1024u &&
               EndsWith(full, out) && EndsWith(out, last_line))) {
      return 1;
    }
    const std::size_t offset = full.size() - out.size();
    if (!Check(offset > 0 && full[offset - 1] == '\n')) {
      return 1;
    }
  }

  return 0;
}
