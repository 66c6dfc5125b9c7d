#pragma once

#include <memory>

#include "internal/util/time.hpp"

namespace registry::core {
class StateStore;
class RegistrationOrchestrator;
} // namespace registry::core
namespace registry::access { class AccessControl; }
namespace registry::season { class SeasonRegistry; }
namespace registry::names { class NameLedger; }
namespace registry::payment { class PaymentVerifier; }

namespace registry::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<registry::core::StateStore>               store;
  std::shared_ptr<registry::access::AccessControl>          access;
  std::shared_ptr<registry::season::SeasonRegistry>         seasons;
  std::shared_ptr<registry::names::NameLedger>              names;
  std::shared_ptr<registry::payment::PaymentVerifier>       payments;
  std::shared_ptr<registry::core::RegistrationOrchestrator> orchestrator;

  registry::util::NowFn now = registry::util::SystemClock();
};

} // namespace registry::service
