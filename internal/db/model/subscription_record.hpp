#pragma once

#include <cstdint>
#include <string>

namespace registry::db::model {

struct SubscriptionRecord {
  std::string user;
  std::string registered_name;
  uint64_t    start_time = 0;
  uint64_t    end_time   = 0;
  uint64_t    payment_id = 0;
  bool        is_active  = true;
};

} // namespace registry::db::model
