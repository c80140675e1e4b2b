#include "contact_directory.h"

#include <algorithm>
#include <cctype>
#include <utility>
#include <vector>

#include "path_guard.h"
#include "platform_fs.h"
#include "platform_log.h"

namespace msgate::gateway {

namespace {

constexpr const char kLogTag[] = "contacts";

bool AllDigits(std::string_view text) {
  if (text.empty()) {
    return false;
  }
  return std::all_of(text.begin(), text.end(), [](unsigned char ch) {
    return std::isdigit(ch) != 0;
  });
}

}  // namespace

bool IsCanonicalNumber(std::string_view number) {
  if (number.size() > 1 && number.front() == '+') {
    return AllDigits(number.substr(1));
  }
  if (number.size() > 2 && number.substr(0, 2) == "00") {
    return AllDigits(number.substr(2));
  }
  return false;
}

std::string IdentityToFilename(const std::string& display_name,
                               const std::string& number,
                               const std::string& ext) {
  return display_name + " " + number + "." + ext;
}

bool FilenameToIdentity(const std::string& filename, const std::string& ext,
                        std::string& display_name, std::string& number) {
  display_name.clear();
  number.clear();
  const std::string suffix = "." + ext;
  if (filename.size() <= suffix.size() ||
      filename.compare(filename.size() - suffix.size(), suffix.size(),
                       suffix) != 0) {
    return false;
  }
  const std::string stem = filename.substr(0, filename.size() - suffix.size());
  const auto space = stem.rfind(' ');
  if (space == std::string::npos) {
    return false;
  }
  std::string name = stem.substr(0, space);
  std::string num = stem.substr(space + 1);
  if (name.find('/') != std::string::npos || !IsCanonicalNumber(num)) {
    return false;
  }
  display_name = std::move(name);
  number = std::move(num);
  return true;
}

ContactDirectory::ContactDirectory(std::filesystem::path contacts_root,
                                   std::filesystem::path attachments_root,
                                   std::string ext)
    : contacts_root_(CleanPath(contacts_root)),
      attachments_root_(CleanPath(attachments_root)),
      ext_(std::move(ext)) {}

ContactDirectory::ContactDirectory(const StorageLayout& layout)
    : ContactDirectory(layout.contacts_dir, layout.attachments_dir,
                       layout.contact_ext) {}

ContactRecord ContactDirectory::MakeRecord(
    const std::string& display_name, const std::string& number,
    const std::filesystem::path& history_path) const {
  ContactRecord record;
  record.display_name = display_name;
  record.number = number;
  record.history_path = history_path;
  record.attachment_dir = attachments_root_ / (display_name + " " + number);
  return record;
}

bool ContactDirectory::ResolveByPath(const std::filesystem::path& path,
                                     ContactRecord& out,
                                     GatewayError& error) const {
  const auto clean = CleanPath(path);
  if (!IsWithin(contacts_root_, clean) ||
      CleanPath(clean.parent_path()) != contacts_root_) {
    error.Set(ErrorCode::kInvalidContact, "invalid contact");
    return false;
  }
  std::string name;
  std::string number;
  if (!FilenameToIdentity(clean.filename().string(), ext_, name, number)) {
    error.Set(ErrorCode::kInvalidContact, "invalid contact");
    return false;
  }
  out = MakeRecord(name, number, clean);
  return true;
}

bool ContactDirectory::ResolveByNumber(const std::string& number,
                                       ContactRecord& out,
                                       GatewayError& error) const {
  if (!IsCanonicalNumber(number)) {
    error.Set(ErrorCode::kInvalidNumber,
              "invalid contact number format: " + number);
    return false;
  }

  std::error_code ec;
  if (!platform::fs::CreatePrivateDirectories(contacts_root_, ec)) {
    error.Set(ErrorCode::kStorageFailure,
              "contacts directory unavailable: " + ec.message());
    return false;
  }

  std::vector<std::filesystem::path> entries;
  if (!platform::fs::ListDir(contacts_root_, entries, ec)) {
    error.Set(ErrorCode::kStorageFailure,
              "contacts listing failed: " + ec.message());
    return false;
  }

  std::vector<std::filesystem::path> matches;
  for (const auto& entry : entries) {
    std::string entry_name;
    std::string entry_number;
    if (!FilenameToIdentity(entry.filename().string(), ext_, entry_name,
                            entry_number)) {
      continue;
    }
    if (entry_number == number) {
      matches.push_back(entry);
    }
  }

  if (matches.empty()) {
    out = MakeRecord(kUnknownContactName, number,
                     contacts_root_ / IdentityToFilename(kUnknownContactName,
                                                         number, ext_));
    return true;
  }

  std::sort(matches.begin(), matches.end());
  if (matches.size() > 1) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "several contacts share a number, using the first",
                       {{"number", number},
                        {"selected", matches.front().filename().string()}});
  }
  return ResolveByPath(matches.front(), out, error);
}

}  // namespace msgate::gateway
