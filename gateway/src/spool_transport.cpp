#include "spool_transport.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <utility>
#include <vector>

#include "platform_fs.h"
#include "platform_log.h"
#include "platform_random.h"
#include "platform_time.h"
#include "secure_buffer.h"
#include "storage_layout.h"

namespace msgate::gateway {

namespace {

constexpr const char kLogTag[] = "spool";
constexpr const char kEnvelopeExt[] = ".msg";
constexpr std::size_t kCopyChunk = 64u * 1024u;
constexpr std::uint64_t kMaxEnvelopeBytes = 1024u * 1024u;
constexpr std::size_t kSentinelKeyBytes = 32;
constexpr std::uint32_t kStopCheckMs = 50;

struct Envelope {
  std::string peer;
  std::uint64_t timestamp{0};
  std::vector<std::pair<std::string, std::string>> attachments;
  std::string body;
};

bool IsSafeFileName(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return name.find('/') == std::string::npos;
}

bool ParseEnvelope(const std::string& raw, Envelope& out) {
  std::size_t pos = 0;
  while (pos < raw.size()) {
    const auto eol = raw.find('\n', pos);
    if (eol == std::string::npos) {
      return false;
    }
    const std::string line = raw.substr(pos, eol - pos);
    pos = eol + 1;
    if (line.empty()) {
      out.body = raw.substr(pos);
      return !out.peer.empty();
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      return false;
    }
    const std::string key = line.substr(0, colon);
    std::string value = line.substr(colon + 1);
    if (!value.empty() && value.front() == ' ') {
      value.erase(0, 1);
    }
    if (key == "From") {
      out.peer = value;
    } else if (key == "Timestamp") {
      char* end_ptr = nullptr;
      const unsigned long long ts = std::strtoull(value.c_str(), &end_ptr, 10);
      if (end_ptr == value.c_str() || *end_ptr != '\0') {
        return false;
      }
      out.timestamp = ts;
    } else if (key == "Attachment") {
      const auto space = value.find(' ');
      std::string name = value.substr(0, space);
      std::string type =
          space == std::string::npos ? std::string() : value.substr(space + 1);
      if (!IsSafeFileName(name)) {
        return false;
      }
      out.attachments.emplace_back(std::move(name), std::move(type));
    }
  }
  return false;
}

}  // namespace

SpoolTransport::SpoolTransport(std::filesystem::path spool_dir,
                               std::uint32_t poll_interval_ms)
    : spool_dir_(std::move(spool_dir)),
      outbox_dir_(spool_dir_ / "outbox"),
      inbox_dir_(spool_dir_ / "inbox"),
      poll_interval_ms_(poll_interval_ms == 0 ? 500 : poll_interval_ms) {}

bool SpoolTransport::Setup(const TransportConfig& config,
                           TransportHooks& hooks, std::string& error) {
  if (config.tel.empty()) {
    error = "telephone number missing";
    return false;
  }
  if (!Provision(config, hooks, error)) {
    return false;
  }
  std::error_code ec;
  if (!platform::fs::CreatePrivateDirectories(outbox_dir_, ec) ||
      !platform::fs::CreatePrivateDirectories(inbox_dir_, ec)) {
    error = "spool dir create failed: " + ec.message();
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    tel_ = config.tel;
  }
  ready_.store(true);
  platform::log::Log(platform::log::Level::kInfo, kLogTag, "transport ready",
                     {{"spool", spool_dir_.string()}});
  return true;
}

bool SpoolTransport::Provision(const TransportConfig& config,
                               TransportHooks& hooks, std::string& error) {
  const auto sentinel =
      config.storage_dir / "prekeys" / LastResortKeyFileName();
  std::error_code ec;
  const bool provisioned = platform::fs::Exists(sentinel, ec);
  if (ec) {
    error = "key storage check failed: " + ec.message();
    return false;
  }
  if (provisioned) {
    return true;
  }

  platform::log::Log(platform::log::Level::kInfo, kLogTag,
                     "registering number",
                     {{"number", config.tel},
                      {"via", config.verification_type}});
  std::string code = hooks.VerificationCode();
  common::ScopedWipe wipe_code(code);
  if (code.empty()) {
    error = "verification code missing";
    return false;
  }
  // Local storage password hook is consulted; an empty one means the key
  // files rely on the volume encryption.
  std::string storage_password = hooks.StoragePassword();
  common::ScopedWipe wipe_password(storage_password);

  if (!platform::fs::CreatePrivateDirectories(sentinel.parent_path(), ec)) {
    error = "prekey dir create failed: " + ec.message();
    return false;
  }
  std::vector<std::uint8_t> key(kSentinelKeyBytes);
  if (!platform::RandomBytes(key.data(), key.size())) {
    error = "rng failed";
    return false;
  }
  const bool written =
      platform::fs::AtomicWrite(sentinel, key.data(), key.size(), ec);
  common::SecureWipe(key);
  if (!written) {
    error = "prekey write failed: " + ec.message();
    return false;
  }
  hooks.RegistrationDone();
  return true;
}

bool SpoolTransport::NewSpoolId(std::string& out, std::string& error) const {
  std::string suffix;
  if (!platform::RandomHex(8, suffix)) {
    error = "rng failed";
    return false;
  }
  out = std::to_string(platform::NowUnixSeconds()) + "_" + suffix;
  return true;
}

bool SpoolTransport::WriteEnvelope(const std::string& number,
                                   const std::string& text,
                                   const std::string& attachment_name,
                                   std::string& error) {
  std::string id;
  if (!NewSpoolId(id, error)) {
    return false;
  }
  std::string from;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    from = tel_;
  }
  std::ostringstream oss;
  oss << "To: " << number << "\n";
  oss << "From: " << from << "\n";
  oss << "Timestamp: " << platform::NowUnixSeconds() << "\n";
  if (!attachment_name.empty()) {
    oss << "Attachment: " << attachment_name << "\n";
  }
  oss << "\n" << text;
  const std::string envelope = oss.str();
  std::error_code ec;
  if (!platform::fs::AtomicWrite(
          outbox_dir_ / (id + kEnvelopeExt),
          reinterpret_cast<const std::uint8_t*>(envelope.data()),
          envelope.size(), ec)) {
    error = "outbox write failed: " + ec.message();
    return false;
  }
  return true;
}

bool SpoolTransport::Send(const std::string& number, const std::string& text,
                          std::string& error) {
  if (!ready_.load()) {
    error = "transport not ready";
    return false;
  }
  return WriteEnvelope(number, text, std::string(), error);
}

bool SpoolTransport::SendAttachment(const std::string& number,
                                    const std::string& text,
                                    std::istream& attachment,
                                    std::string& error) {
  if (!ready_.load()) {
    error = "transport not ready";
    return false;
  }
  std::string id;
  if (!NewSpoolId(id, error)) {
    return false;
  }
  const std::string name = id + ".att";
  const auto path = outbox_dir_ / name;
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      error = "outbox attachment open failed";
      return false;
    }
    std::vector<char> chunk(kCopyChunk);
    while (attachment) {
      attachment.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
      const std::streamsize got = attachment.gcount();
      if (got > 0) {
        ofs.write(chunk.data(), got);
      }
    }
    if (attachment.bad() || !ofs) {
      ofs.close();
      std::error_code ec;
      platform::fs::Remove(path, ec);
      error = "outbox attachment write failed";
      return false;
    }
  }
  if (!WriteEnvelope(number, text, name, error)) {
    std::error_code ec;
    platform::fs::Remove(path, ec);
    return false;
  }
  return true;
}

bool SpoolTransport::Listen(const InboundHandler& handler,
                            const std::atomic<bool>& stop,
                            std::string& error) {
  if (!ready_.load()) {
    error = "transport not ready";
    return false;
  }
  while (!stop.load()) {
    if (!DeliverInbox(handler, error)) {
      return false;
    }
    for (std::uint32_t waited = 0;
         waited < poll_interval_ms_ && !stop.load(); waited += kStopCheckMs) {
      platform::SleepMs(std::min(kStopCheckMs, poll_interval_ms_ - waited));
    }
  }
  return true;
}

bool SpoolTransport::DeliverInbox(const InboundHandler& handler,
                                  std::string& error) {
  std::vector<std::filesystem::path> entries;
  std::error_code ec;
  if (!platform::fs::ListDir(inbox_dir_, entries, ec)) {
    error = "inbox list failed: " + ec.message();
    return false;
  }
  std::sort(entries.begin(), entries.end());
  for (const auto& entry : entries) {
    if (entry.extension() != kEnvelopeExt) {
      continue;
    }
    std::string envelope_error;
    if (!DeliverEnvelope(entry, handler, envelope_error)) {
      platform::log::Log(platform::log::Level::kWarn, kLogTag,
                         "dropping inbox envelope",
                         {{"file", entry.filename().string()},
                          {"error", envelope_error}});
      platform::fs::Remove(entry, ec);
    }
  }
  return true;
}

bool SpoolTransport::DeliverEnvelope(const std::filesystem::path& path,
                                     const InboundHandler& handler,
                                     std::string& error) {
  std::error_code ec;
  const std::uint64_t size = platform::fs::FileSize(path, ec);
  if (ec || size > kMaxEnvelopeBytes) {
    error = "envelope size invalid";
    return false;
  }
  std::string raw;
  {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
      error = "envelope open failed";
      return false;
    }
    raw.assign(std::istreambuf_iterator<char>(ifs),
               std::istreambuf_iterator<char>());
  }
  Envelope envelope;
  if (!ParseEnvelope(raw, envelope)) {
    error = "envelope malformed";
    return false;
  }

  InboundMessage message;
  message.source = envelope.peer;
  message.body = std::move(envelope.body);
  message.timestamp = envelope.timestamp;
  std::vector<std::filesystem::path> attachment_paths;
  for (const auto& [name, type] : envelope.attachments) {
    const auto attachment_path = inbox_dir_ / name;
    auto stream =
        std::make_unique<std::ifstream>(attachment_path, std::ios::binary);
    if (!stream->is_open()) {
      platform::log::Log(platform::log::Level::kWarn, kLogTag,
                         "inbox attachment missing", {{"file", name}});
      continue;
    }
    InboundAttachment attachment;
    attachment.content_type = type;
    attachment.data = std::move(stream);
    message.attachments.push_back(std::move(attachment));
    attachment_paths.push_back(attachment_path);
  }

  handler(message);

  message.attachments.clear();
  for (const auto& attachment_path : attachment_paths) {
    platform::fs::Remove(attachment_path, ec);
  }
  if (!platform::fs::Remove(path, ec)) {
    error = "envelope remove failed: " + ec.message();
    return false;
  }
  return true;
}

}  // namespace msgate::gateway
