#pragma once

#include <string>

#include "registry/v1/content_service.pb.h"
#include "service_context.hpp"

namespace registry::db {
class Transaction;
} // namespace registry::db

namespace registry::service {

/*
  Metadata and markdown attached to registered names.

  Only the owner of the name or an Admin may write. Every save bumps the
  name record's updated_at in the same write section.
*/
class ContentService {
 public:
  explicit ContentService(ServiceContext ctx);

  void                       SaveMetadata(const std::string& caller, const registry::v1::SaveMetadataRequest& req);
  registry::v1::NameMetadata GetMetadata(const std::string& caller, const registry::v1::ContentNameRequest& req);

  void                          SaveMarkdown(const std::string& caller, const registry::v1::SaveMarkdownRequest& req);
  registry::v1::MarkdownContent GetMarkdown(const std::string& caller, const registry::v1::ContentNameRequest& req);

 private:
  // Throws NotFound for unknown names, Unauthorized unless caller owns the
  // name or is Admin.
  void RequireWriter(db::Transaction& tx, const std::string& caller, const std::string& name);

  ServiceContext ctx_;
};

} // namespace registry::service
