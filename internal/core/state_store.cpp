#include "state_store.hpp"

#include <stdexcept>
#include <string>

namespace registry::core {

void ThrowIfDbError(const db::Result& result, const char* what) {
  if (result) {
    return;
  }
  throw std::runtime_error(std::string(what) + ": " + std::string(db::ErrorCodeName(result.code)) + ": " + result.message);
}

} // namespace registry::core
