#include "payment_verifier.hpp"

#include <chrono>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace registry::payment {

namespace {

bool IsQualifyingTransfer(const registry::ledger::v1::Block& block, uint64_t expected_amount, const std::string& expected_recipient,
                          std::string& reason) {
  switch (block.operation_case()) {
    case registry::ledger::v1::Block::kTransfer:
      break;
    case registry::ledger::v1::Block::kMint:
      reason = "mint";
      return false;
    case registry::ledger::v1::Block::kBurn:
      reason = "burn";
      return false;
    case registry::ledger::v1::Block::kApprove:
      reason = "approve";
      return false;
    case registry::ledger::v1::Block::OPERATION_NOT_SET:
      reason = "no operation";
      return false;
  }

  const auto& transfer = block.transfer();
  if (transfer.to() != expected_recipient) {
    reason = "wrong recipient";
    return false;
  }
  if (transfer.amount() < expected_amount) {
    reason = "short amount";
    return false;
  }
  return true;
}

} // namespace

PaymentVerifier::PaymentVerifier(std::shared_ptr<core::StateStore> store, std::shared_ptr<LedgerClient> ledger)
    : store_(std::move(store)), ledger_(std::move(ledger)) {
}

bool PaymentVerifier::Verify(uint64_t block_index, uint64_t expected_amount, const std::string& expected_recipient) {
  observability::SpanScope span("ledger.GetBlock");
  span.SetAttribute("block_index", static_cast<std::int64_t>(block_index));

  const auto  started_at = std::chrono::steady_clock::now();
  bool        verified   = false;
  std::string reason;
  try {
    auto block = ledger_->GetBlock(block_index);
    if (!block) {
      reason = "block not found";
    } else {
      verified = IsQualifyingTransfer(*block, expected_amount, expected_recipient, reason);
    }
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    reason = e.what();
  }

  observability::Metrics::Instance().ObserveLedgerVerifyMs(
      verified, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());

  if (!verified) {
    REGISTRY_LOG_WARN("payment not verified", {observability::UintField("block_index", block_index), observability::StringField("reason", reason)});
  }
  return verified;
}

bool PaymentVerifier::IsReferenceUsed(uint64_t block_index) {
  return store_->Read([&](db::Transaction& tx) { return IsReferenceUsed(tx, block_index); });
}

bool PaymentVerifier::IsReferenceUsed(db::Transaction& tx, uint64_t block_index) {
  return store_->Repo().IsBlockConsumed(tx, block_index);
}

bool PaymentVerifier::Consume(db::Transaction& tx, uint64_t block_index, uint64_t now) {
  auto result = store_->Repo().InsertConsumedBlock(tx, block_index, now);
  if (result.code == db::ErrorCode::AlreadyExists) {
    return false;
  }
  core::ThrowIfDbError(result, "consume block");
  return true;
}

std::optional<db::model::PaymentRecord> PaymentVerifier::GetByBlock(uint64_t block_index) {
  return store_->Read([&](db::Transaction& tx) { return store_->Repo().GetPaymentByBlock(tx, block_index); });
}

std::vector<db::model::PaymentRecord> PaymentVerifier::History(const std::string& payer) {
  return store_->Read([&](db::Transaction& tx) { return store_->Repo().ListPaymentsByPayer(tx, payer); });
}

std::vector<db::model::PaymentRecord> PaymentVerifier::All() {
  return store_->Read([&](db::Transaction& tx) { return store_->Repo().ListPayments(tx); });
}

} // namespace registry::payment
