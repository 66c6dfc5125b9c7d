#include "content_service.hpp"

#include "internal/access/access_control.hpp"
#include "internal/core/state_store.hpp"
#include "internal/names/name_ledger.hpp"
#include "observe_rpc.hpp"
#include "record_convert.hpp"

namespace registry::service {

using namespace registry::v1;

ContentService::ContentService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void ContentService::RequireWriter(db::Transaction& tx, const std::string& caller, const std::string& name) {
  auto record = ctx_.names->Find(tx, name);
  if (!record) {
    throw util::NotFound("name " + name + " is not registered");
  }
  if (access::IsAnonymous(caller) || (record->owner != caller && ctx_.access->RoleOf(tx, caller) != USER_ROLE_ADMIN)) {
    throw util::Unauthorized("only the owner of " + name + " or an admin may edit its content");
  }
}

void ContentService::SaveMetadata(const std::string& caller, const SaveMetadataRequest& req) {
  ObserveRpc("ContentService.SaveMetadata", caller, [&] {
    const auto now = ctx_.now();
    ctx_.store->Write([&](db::Transaction& tx) {
      RequireWriter(tx, caller, req.name());

      auto& repo     = ctx_.store->Repo();
      auto  existing = repo.GetMetadata(tx, req.name());

      db::model::MetadataRecord record;
      record.name        = req.name();
      record.title       = req.title();
      record.description = req.description();
      record.image       = req.image();
      record.created_at  = existing ? existing->created_at : now;
      record.updated_at  = now;

      core::ThrowIfDbError(repo.UpsertMetadata(tx, record), "upsert metadata");
      ctx_.names->Touch(tx, req.name(), now);
    });
  });
}

NameMetadata ContentService::GetMetadata(const std::string& caller, const ContentNameRequest& req) {
  return ObserveRpc("ContentService.GetMetadata", caller, [&] {
    auto record = ctx_.store->Read([&](db::Transaction& tx) { return ctx_.store->Repo().GetMetadata(tx, req.name()); });
    if (!record) {
      throw util::NotFound("no metadata for " + req.name());
    }
    return ToProto(*record);
  });
}

void ContentService::SaveMarkdown(const std::string& caller, const SaveMarkdownRequest& req) {
  ObserveRpc("ContentService.SaveMarkdown", caller, [&] {
    const auto now = ctx_.now();
    ctx_.store->Write([&](db::Transaction& tx) {
      RequireWriter(tx, caller, req.name());

      db::model::MarkdownRecord record;
      record.name       = req.name();
      record.content    = req.content();
      record.updated_at = now;

      core::ThrowIfDbError(ctx_.store->Repo().UpsertMarkdown(tx, record), "upsert markdown");
      ctx_.names->Touch(tx, req.name(), now);
    });
  });
}

MarkdownContent ContentService::GetMarkdown(const std::string& caller, const ContentNameRequest& req) {
  return ObserveRpc("ContentService.GetMarkdown", caller, [&] {
    auto record = ctx_.store->Read([&](db::Transaction& tx) { return ctx_.store->Repo().GetMarkdown(tx, req.name()); });
    if (!record) {
      throw util::NotFound("no markdown for " + req.name());
    }
    return ToProto(*record);
  });
}

} // namespace registry::service
