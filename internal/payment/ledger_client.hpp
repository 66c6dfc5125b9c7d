#pragma once

#include <cstdint>
#include <optional>

#include "registry/ledger/v1/ledger.pb.h"

namespace registry::payment {

/*
  Read access to the external token ledger.

  GetBlock returns nullopt when the ledger has no block at index and throws
  on transport failures.
*/
class LedgerClient {
 public:
  virtual ~LedgerClient() = default;

  virtual std::optional<registry::ledger::v1::Block> GetBlock(uint64_t index) = 0;
};

} // namespace registry::payment
