#include "content_server.hpp"

#include "grpc_error.hpp"

namespace registry::grpc {

ContentServer::ContentServer(std::shared_ptr<registry::service::ContentService> svc) : service_(std::move(svc)) {
}

::grpc::Status ContentServer::SaveMetadata(::grpc::ServerContext* context, const registry::v1::SaveMetadataRequest* req, google::protobuf::Empty*) {
  return Serve([&] { service_->SaveMetadata(CallerOf(context), *req); });
}

::grpc::Status ContentServer::GetMetadata(::grpc::ServerContext* context, const registry::v1::ContentNameRequest* req, registry::v1::NameMetadata* resp) {
  return Serve([&] { *resp = service_->GetMetadata(CallerOf(context), *req); });
}

::grpc::Status ContentServer::SaveMarkdown(::grpc::ServerContext* context, const registry::v1::SaveMarkdownRequest* req, google::protobuf::Empty*) {
  return Serve([&] { service_->SaveMarkdown(CallerOf(context), *req); });
}

::grpc::Status ContentServer::GetMarkdown(::grpc::ServerContext* context, const registry::v1::ContentNameRequest* req, registry::v1::MarkdownContent* resp) {
  return Serve([&] { *resp = service_->GetMarkdown(CallerOf(context), *req); });
}

} // namespace registry::grpc
