#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/content_service.hpp"
#include "registry/v1/content_service.grpc.pb.h"

namespace registry::grpc {

class ContentServer final : public registry::v1::ContentService::Service {
 public:
  explicit ContentServer(std::shared_ptr<registry::service::ContentService> svc);

  ::grpc::Status SaveMetadata(::grpc::ServerContext* context, const registry::v1::SaveMetadataRequest* req, google::protobuf::Empty* resp) override;
  ::grpc::Status GetMetadata(::grpc::ServerContext* context, const registry::v1::ContentNameRequest* req, registry::v1::NameMetadata* resp) override;
  ::grpc::Status SaveMarkdown(::grpc::ServerContext* context, const registry::v1::SaveMarkdownRequest* req, google::protobuf::Empty* resp) override;
  ::grpc::Status GetMarkdown(::grpc::ServerContext* context, const registry::v1::ContentNameRequest* req, registry::v1::MarkdownContent* resp) override;

 private:
  std::shared_ptr<registry::service::ContentService> service_;
};

} // namespace registry::grpc
