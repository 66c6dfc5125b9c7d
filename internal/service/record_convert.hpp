#pragma once

#include "internal/db/model/content_record.hpp"
#include "internal/db/model/name_record.hpp"
#include "internal/db/model/payment_record.hpp"
#include "internal/db/model/season_record.hpp"
#include "internal/db/model/subscription_record.hpp"
#include "registry/v1/types.pb.h"

namespace registry::service {

// Repository rows to their wire form.
registry::v1::Season          ToProto(const db::model::SeasonRecord& record);
registry::v1::NameRecord      ToProto(const db::model::NameRecord& record);
registry::v1::VerifiedPayment ToProto(const db::model::PaymentRecord& record);
registry::v1::Subscription    ToProto(const db::model::SubscriptionRecord& record);
registry::v1::NameMetadata    ToProto(const db::model::MetadataRecord& record);
registry::v1::MarkdownContent ToProto(const db::model::MarkdownRecord& record);

} // namespace registry::service
