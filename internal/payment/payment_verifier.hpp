#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/state_store.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/payment/ledger_client.hpp"

namespace registry::payment {

/*
  PaymentVerifier

  Confirms that a ledger block is a qualifying transfer and guards against
  one block funding more than one registration.

  Verify performs a blocking ledger call and must run outside any StateStore
  section. Consume must run inside the write section that commits the
  registration it pays for.
*/
class PaymentVerifier {
 public:
  PaymentVerifier(std::shared_ptr<core::StateStore> store, std::shared_ptr<LedgerClient> ledger);

  // True only for a transfer to expected_recipient of at least
  // expected_amount. Any ledger failure yields false.
  bool Verify(uint64_t block_index, uint64_t expected_amount, const std::string& expected_recipient);

  bool IsReferenceUsed(uint64_t block_index);
  bool IsReferenceUsed(db::Transaction& tx, uint64_t block_index);

  // Marks block_index consumed; false if it already was.
  bool Consume(db::Transaction& tx, uint64_t block_index, uint64_t now);

  std::optional<db::model::PaymentRecord> GetByBlock(uint64_t block_index);
  std::vector<db::model::PaymentRecord>   History(const std::string& payer);
  std::vector<db::model::PaymentRecord>   All();

 private:
  std::shared_ptr<core::StateStore> store_;
  std::shared_ptr<LedgerClient>     ledger_;
};

} // namespace registry::payment
