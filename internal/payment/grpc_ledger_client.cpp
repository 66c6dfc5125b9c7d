#include "grpc_ledger_client.hpp"

#include <stdexcept>

namespace registry::payment {

GrpcLedgerClient::GrpcLedgerClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(registry::ledger::v1::LedgerQueryService::NewStub(std::move(channel))), deadline_(deadline) {
}

std::shared_ptr<GrpcLedgerClient> GrpcLedgerClient::Connect(const std::string& endpoint, bool use_tls, std::chrono::milliseconds deadline) {
  auto credentials = use_tls ? ::grpc::SslCredentials(::grpc::SslCredentialsOptions{}) : ::grpc::InsecureChannelCredentials();
  return std::make_shared<GrpcLedgerClient>(::grpc::CreateChannel(endpoint, credentials), deadline);
}

std::optional<registry::ledger::v1::Block> GrpcLedgerClient::GetBlock(uint64_t index) {
  ::grpc::ClientContext context;
  if (deadline_.count() > 0) {
    context.set_deadline(std::chrono::system_clock::now() + deadline_);
  }

  registry::ledger::v1::GetBlockRequest request;
  request.set_index(index);
  registry::ledger::v1::GetBlockResponse response;

  const auto status = stub_->GetBlock(&context, request, &response);
  if (!status.ok()) {
    throw std::runtime_error("ledger GetBlock(" + std::to_string(index) + ") failed: " + status.error_message());
  }
  if (!response.found()) {
    return std::nullopt;
  }
  return response.block();
}

} // namespace registry::payment
