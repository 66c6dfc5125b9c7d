#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/payment/ledger_client.hpp"
#include "registry/ledger/v1/ledger.grpc.pb.h"

namespace registry::payment {

class GrpcLedgerClient final : public LedgerClient {
 public:
  // deadline of zero means calls wait indefinitely
  GrpcLedgerClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline);

  static std::shared_ptr<GrpcLedgerClient> Connect(const std::string& endpoint, bool use_tls, std::chrono::milliseconds deadline);

  std::optional<registry::ledger::v1::Block> GetBlock(uint64_t index) override;

 private:
  std::unique_ptr<registry::ledger::v1::LedgerQueryService::Stub> stub_;
  std::chrono::milliseconds                                       deadline_;
};

} // namespace registry::payment
