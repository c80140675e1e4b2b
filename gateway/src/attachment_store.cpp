#include "attachment_store.h"

#include <array>
#include <fstream>

#include "platform_fs.h"
#include "platform_log.h"
#include "platform_random.h"

namespace msgate::gateway {

namespace {

constexpr const char kLogTag[] = "attachments";
constexpr int kMaxNameAttempts = 16;
constexpr std::size_t kNameRandomBytes = 8;
constexpr std::size_t kCopyChunk = 64u * 1024u;

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  platform::fs::Remove(path, ec);
}

}  // namespace

AttachmentStore::AttachmentStore(const PathGuard& guard) : guard_(guard) {}

bool AttachmentStore::CreateUnique(const std::filesystem::path& dir,
                                   std::filesystem::path& out,
                                   GatewayError& error) const {
  for (int attempt = 0; attempt < kMaxNameAttempts; ++attempt) {
    std::string suffix;
    if (!platform::RandomHex(kNameRandomBytes, suffix)) {
      error.Set(ErrorCode::kStorageFailure, "attachment name rng failed");
      return false;
    }
    const auto candidate = dir / (std::string(kAttachmentPrefix) + suffix);
    std::error_code ec;
    if (platform::fs::CreateExclusive(candidate, ec)) {
      out = candidate;
      return true;
    }
    if (ec != std::errc::file_exists) {
      error.Set(ErrorCode::kStorageFailure,
                "attachment create failed: " + ec.message());
      return false;
    }
  }
  error.Set(ErrorCode::kStorageFailure, "attachment name exhausted");
  return false;
}

bool AttachmentStore::Save(const ContactRecord& contact, std::istream& source,
                           std::string& relative_name,
                           GatewayError& error) const {
  relative_name.clear();
  if (contact.attachment_dir.empty()) {
    error.Set(ErrorCode::kInvalidContact, "contact has no attachment dir");
    return false;
  }

  std::error_code ec;
  if (!platform::fs::CreatePrivateDirectories(contact.attachment_dir, ec)) {
    error.Set(ErrorCode::kStorageFailure,
              "attachment dir unavailable: " + ec.message());
    return false;
  }

  std::filesystem::path path;
  if (!CreateUnique(contact.attachment_dir, path, error)) {
    return false;
  }

  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) {
    RemoveQuietly(path);
    error.Set(ErrorCode::kStorageFailure, "attachment open failed");
    return false;
  }

  std::array<char, kCopyChunk> buf{};
  std::uint64_t total = 0;
  while (source) {
    source.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const std::streamsize got = source.gcount();
    if (got <= 0) {
      break;
    }
    ofs.write(buf.data(), got);
    if (!ofs) {
      break;
    }
    total += static_cast<std::uint64_t>(got);
  }
  const bool read_failed = source.bad();
  ofs.close();
  if (read_failed || !ofs) {
    RemoveQuietly(path);
    error.Set(ErrorCode::kStorageFailure,
              read_failed ? "attachment source read failed"
                          : "attachment write failed");
    return false;
  }

  if (!guard_.RelativeToRoot(path, relative_name)) {
    RemoveQuietly(path);
    error.Set(ErrorCode::kStorageFailure,
              "attachment stored outside storage root");
    return false;
  }

  platform::log::Log(platform::log::Level::kInfo, kLogTag, "saved attachment",
                     {{"contact", contact.display_name},
                      {"number", contact.number},
                      {"bytes", std::to_string(total)}});
  return true;
}

}  // namespace msgate::gateway
