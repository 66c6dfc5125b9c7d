#include "record_convert.hpp"

namespace registry::service {

registry::v1::Season ToProto(const db::model::SeasonRecord& record) {
  registry::v1::Season season;
  season.set_id(record.id);
  season.set_name(record.name);
  season.set_start_time(record.start_time);
  season.set_end_time(record.end_time);
  season.set_max_names(record.max_names);
  season.set_min_name_length(record.min_name_length);
  season.set_max_name_length(record.max_name_length);
  season.set_price(record.price);
  season.set_status(record.status);
  season.set_created_at(record.created_at);
  season.set_updated_at(record.updated_at);
  return season;
}

registry::v1::NameRecord ToProto(const db::model::NameRecord& record) {
  registry::v1::NameRecord name;
  name.set_name(record.name);
  name.set_address(record.address);
  name.set_address_type(record.address_type);
  name.set_owner(record.owner);
  name.set_season_id(record.season_id);
  name.set_created_at(record.created_at);
  name.set_updated_at(record.updated_at);
  return name;
}

registry::v1::VerifiedPayment ToProto(const db::model::PaymentRecord& record) {
  registry::v1::VerifiedPayment payment;
  payment.set_id(record.id);
  payment.set_payer(record.payer);
  payment.set_amount(record.amount);
  payment.set_block_index(record.block_index);
  payment.set_verified_at(record.verified_at);
  payment.set_registration_name(record.registration_name);
  return payment;
}

registry::v1::Subscription ToProto(const db::model::SubscriptionRecord& record) {
  registry::v1::Subscription subscription;
  subscription.set_user(record.user);
  subscription.set_registered_name(record.registered_name);
  subscription.set_start_time(record.start_time);
  subscription.set_end_time(record.end_time);
  subscription.set_payment_id(record.payment_id);
  subscription.set_is_active(record.is_active);
  return subscription;
}

registry::v1::NameMetadata ToProto(const db::model::MetadataRecord& record) {
  registry::v1::NameMetadata metadata;
  metadata.set_name(record.name);
  metadata.set_title(record.title);
  metadata.set_description(record.description);
  metadata.set_image(record.image);
  metadata.set_created_at(record.created_at);
  metadata.set_updated_at(record.updated_at);
  return metadata;
}

registry::v1::MarkdownContent ToProto(const db::model::MarkdownRecord& record) {
  registry::v1::MarkdownContent markdown;
  markdown.set_name(record.name);
  markdown.set_content(record.content);
  markdown.set_updated_at(record.updated_at);
  return markdown;
}

} // namespace registry::service
