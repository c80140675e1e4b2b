#ifndef MSGATE_GATEWAY_ATTACHMENT_STORE_H
#define MSGATE_GATEWAY_ATTACHMENT_STORE_H

#include <istream>
#include <string>

#include "contact_directory.h"
#include "gateway_error.h"
#include "path_guard.h"

namespace msgate::gateway {

constexpr const char kAttachmentPrefix[] = "attachment_";

class AttachmentStore {
 public:
  // `guard` supplies the storage root that returned names are relative to.
  explicit AttachmentStore(const PathGuard& guard);

  // Streams `source` into a freshly created file inside
  // `contact.attachment_dir`. `relative_name` is relative to the storage
  // root, e.g. "textsecure/attachments/Alice +1555/attachment_0a1b...".
  bool Save(const ContactRecord& contact, std::istream& source,
            std::string& relative_name, GatewayError& error) const;

 private:
  bool CreateUnique(const std::filesystem::path& dir,
                    std::filesystem::path& out, GatewayError& error) const;

  const PathGuard& guard_;
};

}  // namespace msgate::gateway

#endif  // MSGATE_GATEWAY_ATTACHMENT_STORE_H
