#include "pg_repository.hpp"

#include <stdexcept>

namespace registry::db::postgres {

namespace {

constexpr const char* kSeasonColumns =
    "SELECT id,name,start_time,end_time,max_names,min_name_length,max_name_length,price,status,created_at,updated_at FROM seasons";
constexpr const char* kPaymentColumns = "SELECT id,payer,amount,block_index,verified_at,registration_name FROM verified_payments";
constexpr const char* kSubscriptionColumns = "SELECT \"user\",registered_name,start_time,end_time,payment_id,is_active FROM subscriptions";

model::SeasonRecord ReadSeason(const pqxx::row& row) {
  model::SeasonRecord r;
  r.id              = row[0].as<uint64_t>();
  r.name            = row[1].c_str();
  r.start_time      = row[2].as<uint64_t>();
  r.end_time        = row[3].as<uint64_t>();
  r.max_names       = row[4].as<uint64_t>();
  r.min_name_length = row[5].as<uint64_t>();
  r.max_name_length = row[6].as<uint64_t>();
  r.price           = row[7].as<uint64_t>();
  r.status          = static_cast<registry::v1::SeasonStatus>(row[8].as<int>());
  r.created_at      = row[9].as<uint64_t>();
  r.updated_at      = row[10].as<uint64_t>();
  return r;
}

model::NameRecord ReadName(const pqxx::row& row) {
  model::NameRecord r;
  r.name         = row[0].c_str();
  r.address      = row[1].c_str();
  r.address_type = static_cast<registry::v1::AddressType>(row[2].as<int>());
  r.owner        = row[3].c_str();
  r.season_id    = row[4].as<uint64_t>();
  r.created_at   = row[5].as<uint64_t>();
  r.updated_at   = row[6].as<uint64_t>();
  return r;
}

model::PaymentRecord ReadPayment(const pqxx::row& row) {
  model::PaymentRecord r;
  r.id                = row[0].as<uint64_t>();
  r.payer             = row[1].c_str();
  r.amount            = row[2].as<uint64_t>();
  r.block_index       = row[3].as<uint64_t>();
  r.verified_at       = row[4].as<uint64_t>();
  r.registration_name = row[5].c_str();
  return r;
}

model::SubscriptionRecord ReadSubscription(const pqxx::row& row) {
  model::SubscriptionRecord r;
  r.user            = row[0].c_str();
  r.registered_name = row[1].c_str();
  r.start_time      = row[2].as<uint64_t>();
  r.end_time        = row[3].as<uint64_t>();
  r.payment_id      = row[4].as<uint64_t>();
  r.is_active       = row[5].as<bool>();
  return r;
}

Result InsertedOrExists(const pqxx::result& res, const std::string& what) {
  if (res.affected_rows() == 0) return Result::Err(ErrorCode::AlreadyExists, what);
  return Result::Ok();
}

Result UpdatedOrNotFound(const pqxx::result& res) {
  if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin(TxMode mode) {
  return std::make_unique<PgTransaction>(pool_, mode);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (auto* sql = dynamic_cast<const pqxx::sql_error*>(&e); sql != nullptr && sql->sqlstate() == "25006") {
    return Result::Err(ErrorCode::ReadOnly, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

uint64_t PgRepository::NextId(pqxx::work& work, const char* counter) {
  auto res = work.exec_params("UPDATE registry_counters SET value=value+1 WHERE counter=$1 RETURNING value;", std::string(counter));
  if (res.empty()) throw std::runtime_error(std::string("missing counter ") + counter);
  return res[0][0].as<uint64_t>();
}

// ------------------------------------------------------------------
// Seasons
// ------------------------------------------------------------------

Result PgRepository::InsertSeason(Transaction& t, model::SeasonRecord& r) {
  try {
    auto&    work = TX(t).Work();
    uint64_t id   = r.id != 0 ? r.id : NextId(work, "season");
    auto     res  = work.exec_params(
        "INSERT INTO seasons(id,name,start_time,end_time,max_names,min_name_length,max_name_length,price,status,created_at,updated_at)"
               " VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11) ON CONFLICT DO NOTHING;",
        id, r.name, r.start_time, r.end_time, r.max_names, r.min_name_length, r.max_name_length, r.price, static_cast<int>(r.status),
        r.created_at, r.updated_at);
    auto result = InsertedOrExists(res, "season id " + std::to_string(id));
    if (result) r.id = id;
    return result;
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SeasonRecord> PgRepository::GetSeason(Transaction& t, uint64_t id) {
  auto res = TX(t).Work().exec_prepared("get_season", id);
  if (res.empty()) return std::nullopt;
  return ReadSeason(res[0]);
}

std::vector<model::SeasonRecord> PgRepository::ListSeasons(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kSeasonColumns) + " ORDER BY id;");

  std::vector<model::SeasonRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSeason(row));
  }
  return out;
}

Result PgRepository::UpdateSeason(Transaction& t, const model::SeasonRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE seasons SET name=$2,start_time=$3,end_time=$4,max_names=$5,min_name_length=$6,max_name_length=$7,price=$8,status=$9,"
        "created_at=$10,updated_at=$11 WHERE id=$1;",
        r.id, r.name, r.start_time, r.end_time, r.max_names, r.min_name_length, r.max_name_length, r.price, static_cast<int>(r.status),
        r.created_at, r.updated_at);
    return UpdatedOrNotFound(res);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Names
// ------------------------------------------------------------------

Result PgRepository::InsertName(Transaction& t, const model::NameRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO name_records(name,address,address_type,owner,season_id,created_at,updated_at) VALUES($1,$2,$3,$4,$5,$6,$7)"
        " ON CONFLICT DO NOTHING;",
        r.name, r.address, static_cast<int>(r.address_type), r.owner, r.season_id, r.created_at, r.updated_at);
    return InsertedOrExists(res, "name " + r.name);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::NameRecord> PgRepository::GetName(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_prepared("get_name", name);
  if (res.empty()) return std::nullopt;
  return ReadName(res[0]);
}

std::optional<model::NameRecord> PgRepository::GetNameByOwner(Transaction& t, const std::string& owner) {
  auto res = TX(t).Work().exec_prepared("get_name_by_owner", owner);
  if (res.empty()) return std::nullopt;
  return ReadName(res[0]);
}

std::vector<model::NameRecord> PgRepository::ListNames(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT name,address,address_type,owner,season_id,created_at,updated_at FROM name_records ORDER BY name;");

  std::vector<model::NameRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadName(row));
  }
  return out;
}

uint64_t PgRepository::CountNamesInSeason(Transaction& t, uint64_t season_id) {
  auto res = TX(t).Work().exec_prepared("count_names_in_season", season_id);
  return res.empty() ? 0 : res[0][0].as<uint64_t>();
}

Result PgRepository::TouchName(Transaction& t, const std::string& name, uint64_t updated_at) {
  try {
    return UpdatedOrNotFound(TX(t).Work().exec_params("UPDATE name_records SET updated_at=$2 WHERE name=$1;", name, updated_at));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Roles and profiles
// ------------------------------------------------------------------

Result PgRepository::UpsertRole(Transaction& t, const model::RoleRecord& r) {
  try {
    TX(t).Work().exec_params("INSERT INTO roles(principal,role) VALUES($1,$2) ON CONFLICT(principal) DO UPDATE SET role=EXCLUDED.role;",
                             r.principal, static_cast<int>(r.role));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RoleRecord> PgRepository::GetRole(Transaction& t, const std::string& principal) {
  auto res = TX(t).Work().exec_prepared("get_role", principal);
  if (res.empty()) return std::nullopt;
  return model::RoleRecord{res[0][0].c_str(), static_cast<registry::v1::UserRole>(res[0][1].as<int>())};
}

std::vector<model::RoleRecord> PgRepository::ListRoles(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT principal,role FROM roles ORDER BY principal;");

  std::vector<model::RoleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({row[0].c_str(), static_cast<registry::v1::UserRole>(row[1].as<int>())});
  }
  return out;
}

Result PgRepository::UpsertProfile(Transaction& t, const model::ProfileRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO user_profiles(principal,name) VALUES($1,$2) ON CONFLICT(principal) DO UPDATE SET name=EXCLUDED.name;", r.principal, r.name);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProfileRecord> PgRepository::GetProfile(Transaction& t, const std::string& principal) {
  auto res = TX(t).Work().exec_params("SELECT principal,name FROM user_profiles WHERE principal=$1;", principal);
  if (res.empty()) return std::nullopt;
  return model::ProfileRecord{res[0][0].c_str(), res[0][1].c_str()};
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

bool PgRepository::IsBlockConsumed(Transaction& t, uint64_t block_index) {
  return !TX(t).Work().exec_prepared("is_block_consumed", block_index).empty();
}

Result PgRepository::InsertConsumedBlock(Transaction& t, uint64_t block_index, uint64_t consumed_at) {
  try {
    auto res = TX(t).Work().exec_params("INSERT INTO consumed_blocks(block_index,consumed_at) VALUES($1,$2) ON CONFLICT DO NOTHING;",
                                        block_index, consumed_at);
    return InsertedOrExists(res, "block " + std::to_string(block_index));
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<uint64_t> PgRepository::ListConsumedBlocks(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT block_index FROM consumed_blocks ORDER BY block_index;");

  std::vector<uint64_t> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(row[0].as<uint64_t>());
  }
  return out;
}

Result PgRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  try {
    auto&    work = TX(t).Work();
    uint64_t id   = r.id != 0 ? r.id : NextId(work, "payment");
    auto     res  = work.exec_params(
        "INSERT INTO verified_payments(id,payer,amount,block_index,verified_at,registration_name) VALUES($1,$2,$3,$4,$5,$6)"
             " ON CONFLICT DO NOTHING;",
        id, r.payer, r.amount, r.block_index, r.verified_at, r.registration_name);
    auto result = InsertedOrExists(res, "payment for block " + std::to_string(r.block_index));
    if (result) r.id = id;
    return result;
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::PaymentRecord> PgRepository::GetPaymentByBlock(Transaction& t, uint64_t block_index) {
  auto res = TX(t).Work().exec_params(std::string(kPaymentColumns) + " WHERE block_index=$1;", block_index);
  if (res.empty()) return std::nullopt;
  return ReadPayment(res[0]);
}

std::vector<model::PaymentRecord> PgRepository::ListPayments(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kPaymentColumns) + " ORDER BY id;");

  std::vector<model::PaymentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadPayment(row));
  }
  return out;
}

std::vector<model::PaymentRecord> PgRepository::ListPaymentsByPayer(Transaction& t, const std::string& payer) {
  auto res = TX(t).Work().exec_params(std::string(kPaymentColumns) + " WHERE payer=$1 ORDER BY id;", payer);

  std::vector<model::PaymentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadPayment(row));
  }
  return out;
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result PgRepository::InsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO subscriptions(\"user\",registered_name,start_time,end_time,payment_id,is_active) VALUES($1,$2,$3,$4,$5,$6)"
        " ON CONFLICT DO NOTHING;",
        r.user, r.registered_name, r.start_time, r.end_time, r.payment_id, r.is_active);
    return InsertedOrExists(res, "subscription for " + r.user);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SubscriptionRecord> PgRepository::GetSubscription(Transaction& t, const std::string& user) {
  auto res = TX(t).Work().exec_params(std::string(kSubscriptionColumns) + " WHERE \"user\"=$1;", user);
  if (res.empty()) return std::nullopt;
  return ReadSubscription(res[0]);
}

std::vector<model::SubscriptionRecord> PgRepository::ListSubscriptions(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kSubscriptionColumns) + " ORDER BY \"user\";");

  std::vector<model::SubscriptionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSubscription(row));
  }
  return out;
}

Result PgRepository::DeactivateAllSubscriptions(Transaction& t) {
  try {
    TX(t).Work().exec("UPDATE subscriptions SET is_active=FALSE;");
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Content
// ------------------------------------------------------------------

Result PgRepository::UpsertMetadata(Transaction& t, const model::MetadataRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO name_metadata(name,title,description,image,created_at,updated_at) VALUES($1,$2,$3,$4,$5,$6) "
        "ON CONFLICT(name) DO UPDATE SET title=EXCLUDED.title,description=EXCLUDED.description,image=EXCLUDED.image,"
        "updated_at=EXCLUDED.updated_at;",
        r.name, r.title, r.description, r.image, r.created_at, r.updated_at);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MetadataRecord> PgRepository::GetMetadata(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_params("SELECT name,title,description,image,created_at,updated_at FROM name_metadata WHERE name=$1;", name);
  if (res.empty()) return std::nullopt;

  model::MetadataRecord r;
  r.name        = res[0][0].c_str();
  r.title       = res[0][1].c_str();
  r.description = res[0][2].c_str();
  r.image       = res[0][3].c_str();
  r.created_at  = res[0][4].as<uint64_t>();
  r.updated_at  = res[0][5].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertMarkdown(Transaction& t, const model::MarkdownRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO name_markdown(name,content,updated_at) VALUES($1,$2,$3) "
        "ON CONFLICT(name) DO UPDATE SET content=EXCLUDED.content,updated_at=EXCLUDED.updated_at;",
        r.name, r.content, r.updated_at);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MarkdownRecord> PgRepository::GetMarkdown(Transaction& t, const std::string& name) {
  auto res = TX(t).Work().exec_params("SELECT name,content,updated_at FROM name_markdown WHERE name=$1;", name);
  if (res.empty()) return std::nullopt;
  return model::MarkdownRecord{res[0][0].c_str(), res[0][1].c_str(), res[0][2].as<uint64_t>()};
}

} // namespace registry::db::postgres
