#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace registry::db::sqlite {

using registry::db::ErrorCode;
using registry::db::Result;

namespace {

/*
  Owns one prepared statement for the duration of a call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& Text(int idx, const std::string& s) {
    sqlite3_bind_text(st_, idx, s.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
  }
  Statement& U64(int idx, uint64_t v) {
    sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
    return *this;
  }
  Statement& I32(int idx, int v) {
    sqlite3_bind_int(st_, idx, v);
    return *this;
  }

  int Step() {
    return sqlite3_step(st_);
  }

  std::string ColText(int col) const {
    const unsigned char* t = sqlite3_column_text(st_, col);
    return t ? reinterpret_cast<const char*>(t) : "";
  }
  uint64_t ColU64(int col) const {
    return static_cast<uint64_t>(sqlite3_column_int64(st_, col));
  }
  int ColI32(int col) const {
    return sqlite3_column_int(st_, col);
  }

 private:
  sqlite3*      db_ = nullptr;
  sqlite3_stmt* st_ = nullptr;
};

constexpr const char* kSeasonColumns =
    "id,name,start_time,end_time,max_names,min_name_length,max_name_length,price,status,created_at,updated_at";

model::SeasonRecord ReadSeason(const Statement& st) {
  model::SeasonRecord r;
  r.id              = st.ColU64(0);
  r.name            = st.ColText(1);
  r.start_time      = st.ColU64(2);
  r.end_time        = st.ColU64(3);
  r.max_names       = st.ColU64(4);
  r.min_name_length = st.ColU64(5);
  r.max_name_length = st.ColU64(6);
  r.price           = st.ColU64(7);
  r.status          = static_cast<registry::v1::SeasonStatus>(st.ColI32(8));
  r.created_at      = st.ColU64(9);
  r.updated_at      = st.ColU64(10);
  return r;
}

model::NameRecord ReadName(const Statement& st) {
  model::NameRecord r;
  r.name         = st.ColText(0);
  r.address      = st.ColText(1);
  r.address_type = static_cast<registry::v1::AddressType>(st.ColI32(2));
  r.owner        = st.ColText(3);
  r.season_id    = st.ColU64(4);
  r.created_at   = st.ColU64(5);
  r.updated_at   = st.ColU64(6);
  return r;
}

model::PaymentRecord ReadPayment(const Statement& st) {
  model::PaymentRecord r;
  r.id                = st.ColU64(0);
  r.payer             = st.ColText(1);
  r.amount            = st.ColU64(2);
  r.block_index       = st.ColU64(3);
  r.verified_at       = st.ColU64(4);
  r.registration_name = st.ColText(5);
  return r;
}

model::SubscriptionRecord ReadSubscription(const Statement& st) {
  model::SubscriptionRecord r;
  r.user            = st.ColText(0);
  r.registered_name = st.ColText(1);
  r.start_time      = st.ColU64(2);
  r.end_time        = st.ColU64(3);
  r.payment_id      = st.ColU64(4);
  r.is_active       = st.ColI32(5) != 0;
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
  return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int extended = sqlite3_extended_errcode(db);
      if (extended == SQLITE_CONSTRAINT_PRIMARYKEY || extended == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::ReadOnly, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::NextId(sqlite3* db, const char* counter, uint64_t& id) {
  Statement bump(db, "UPDATE registry_counters SET value=value+1 WHERE counter=?;");
  bump.Text(1, counter);
  if (auto r = Translate(db, bump.Step()); !r) return r;

  Statement read(db, "SELECT value FROM registry_counters WHERE counter=?;");
  read.Text(1, counter);
  int rc = read.Step();
  if (rc != SQLITE_ROW) {
    return rc == SQLITE_DONE ? Result::Err(ErrorCode::InternalError, std::string("missing counter ") + counter) : Translate(db, rc);
  }
  id = read.ColU64(0);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Seasons
// ------------------------------------------------------------------

Result SqliteRepository::InsertSeason(Transaction& t, model::SeasonRecord& r) {
  auto* db = TX(t).Handle();

  uint64_t id = r.id;
  if (id == 0) {
    if (auto res = NextId(db, "season", id); !res) return res;
  }

  Statement st(db,
               "INSERT INTO seasons(id,name,start_time,end_time,max_names,min_name_length,max_name_length,price,status,created_at,updated_at)"
               " VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  st.U64(1, id)
      .Text(2, r.name)
      .U64(3, r.start_time)
      .U64(4, r.end_time)
      .U64(5, r.max_names)
      .U64(6, r.min_name_length)
      .U64(7, r.max_name_length)
      .U64(8, r.price)
      .I32(9, static_cast<int>(r.status))
      .U64(10, r.created_at)
      .U64(11, r.updated_at);

  auto res = Translate(db, st.Step());
  if (res) r.id = id;
  return res;
}

std::optional<model::SeasonRecord> SqliteRepository::GetSeason(Transaction& t, uint64_t id) {
  auto*     db  = TX(t).Handle();
  auto      sql = std::string("SELECT ") + kSeasonColumns + " FROM seasons WHERE id=?;";
  Statement st(db, sql.c_str());
  st.U64(1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadSeason(st);
}

std::vector<model::SeasonRecord> SqliteRepository::ListSeasons(Transaction& t) {
  auto*     db  = TX(t).Handle();
  auto      sql = std::string("SELECT ") + kSeasonColumns + " FROM seasons ORDER BY id;";
  Statement st(db, sql.c_str());

  std::vector<model::SeasonRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadSeason(st));
  }
  return out;
}

Result SqliteRepository::UpdateSeason(Transaction& t, const model::SeasonRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "UPDATE seasons SET name=?,start_time=?,end_time=?,max_names=?,min_name_length=?,max_name_length=?,price=?,status=?,"
               "created_at=?,updated_at=? WHERE id=?;");
  st.Text(1, r.name)
      .U64(2, r.start_time)
      .U64(3, r.end_time)
      .U64(4, r.max_names)
      .U64(5, r.min_name_length)
      .U64(6, r.max_name_length)
      .U64(7, r.price)
      .I32(8, static_cast<int>(r.status))
      .U64(9, r.created_at)
      .U64(10, r.updated_at)
      .U64(11, r.id);

  auto res = Translate(db, st.Step());
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return res;
}

// ------------------------------------------------------------------
// Names
// ------------------------------------------------------------------

Result SqliteRepository::InsertName(Transaction& t, const model::NameRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO name_records(name,address,address_type,owner,season_id,created_at,updated_at) VALUES(?,?,?,?,?,?,?);");
  st.Text(1, r.name)
      .Text(2, r.address)
      .I32(3, static_cast<int>(r.address_type))
      .Text(4, r.owner)
      .U64(5, r.season_id)
      .U64(6, r.created_at)
      .U64(7, r.updated_at);
  return Translate(db, st.Step());
}

std::optional<model::NameRecord> SqliteRepository::GetName(Transaction& t, const std::string& name) {
  Statement st(TX(t).Handle(), "SELECT name,address,address_type,owner,season_id,created_at,updated_at FROM name_records WHERE name=?;");
  st.Text(1, name);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadName(st);
}

std::optional<model::NameRecord> SqliteRepository::GetNameByOwner(Transaction& t, const std::string& owner) {
  Statement st(TX(t).Handle(), "SELECT name,address,address_type,owner,season_id,created_at,updated_at FROM name_records WHERE owner=?;");
  st.Text(1, owner);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadName(st);
}

std::vector<model::NameRecord> SqliteRepository::ListNames(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT name,address,address_type,owner,season_id,created_at,updated_at FROM name_records ORDER BY name;");

  std::vector<model::NameRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadName(st));
  }
  return out;
}

uint64_t SqliteRepository::CountNamesInSeason(Transaction& t, uint64_t season_id) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*) FROM name_records WHERE season_id=?;");
  st.U64(1, season_id);
  if (st.Step() != SQLITE_ROW) return 0;
  return st.ColU64(0);
}

Result SqliteRepository::TouchName(Transaction& t, const std::string& name, uint64_t updated_at) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE name_records SET updated_at=? WHERE name=?;");
  st.U64(1, updated_at).Text(2, name);

  auto res = Translate(db, st.Step());
  if (res && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return res;
}

// ------------------------------------------------------------------
// Roles and profiles
// ------------------------------------------------------------------

Result SqliteRepository::UpsertRole(Transaction& t, const model::RoleRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO roles(principal,role) VALUES(?,?) ON CONFLICT(principal) DO UPDATE SET role=excluded.role;");
  st.Text(1, r.principal).I32(2, static_cast<int>(r.role));
  return Translate(db, st.Step());
}

std::optional<model::RoleRecord> SqliteRepository::GetRole(Transaction& t, const std::string& principal) {
  Statement st(TX(t).Handle(), "SELECT principal,role FROM roles WHERE principal=?;");
  st.Text(1, principal);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return model::RoleRecord{st.ColText(0), static_cast<registry::v1::UserRole>(st.ColI32(1))};
}

std::vector<model::RoleRecord> SqliteRepository::ListRoles(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT principal,role FROM roles ORDER BY principal;");

  std::vector<model::RoleRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back({st.ColText(0), static_cast<registry::v1::UserRole>(st.ColI32(1))});
  }
  return out;
}

Result SqliteRepository::UpsertProfile(Transaction& t, const model::ProfileRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO user_profiles(principal,name) VALUES(?,?) ON CONFLICT(principal) DO UPDATE SET name=excluded.name;");
  st.Text(1, r.principal).Text(2, r.name);
  return Translate(db, st.Step());
}

std::optional<model::ProfileRecord> SqliteRepository::GetProfile(Transaction& t, const std::string& principal) {
  Statement st(TX(t).Handle(), "SELECT principal,name FROM user_profiles WHERE principal=?;");
  st.Text(1, principal);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return model::ProfileRecord{st.ColText(0), st.ColText(1)};
}

// ------------------------------------------------------------------
// Payments
// ------------------------------------------------------------------

bool SqliteRepository::IsBlockConsumed(Transaction& t, uint64_t block_index) {
  Statement st(TX(t).Handle(), "SELECT 1 FROM consumed_blocks WHERE block_index=?;");
  st.U64(1, block_index);
  return st.Step() == SQLITE_ROW;
}

Result SqliteRepository::InsertConsumedBlock(Transaction& t, uint64_t block_index, uint64_t consumed_at) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO consumed_blocks(block_index,consumed_at) VALUES(?,?);");
  st.U64(1, block_index).U64(2, consumed_at);
  return Translate(db, st.Step());
}

std::vector<uint64_t> SqliteRepository::ListConsumedBlocks(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT block_index FROM consumed_blocks ORDER BY block_index;");

  std::vector<uint64_t> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(st.ColU64(0));
  }
  return out;
}

Result SqliteRepository::InsertPayment(Transaction& t, model::PaymentRecord& r) {
  auto* db = TX(t).Handle();

  uint64_t id = r.id;
  if (id == 0) {
    if (auto res = NextId(db, "payment", id); !res) return res;
  }

  Statement st(db, "INSERT INTO verified_payments(id,payer,amount,block_index,verified_at,registration_name) VALUES(?,?,?,?,?,?);");
  st.U64(1, id).Text(2, r.payer).U64(3, r.amount).U64(4, r.block_index).U64(5, r.verified_at).Text(6, r.registration_name);

  auto res = Translate(db, st.Step());
  if (res) r.id = id;
  return res;
}

std::optional<model::PaymentRecord> SqliteRepository::GetPaymentByBlock(Transaction& t, uint64_t block_index) {
  Statement st(TX(t).Handle(),
               "SELECT id,payer,amount,block_index,verified_at,registration_name FROM verified_payments WHERE block_index=?;");
  st.U64(1, block_index);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadPayment(st);
}

std::vector<model::PaymentRecord> SqliteRepository::ListPayments(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT id,payer,amount,block_index,verified_at,registration_name FROM verified_payments ORDER BY id;");

  std::vector<model::PaymentRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadPayment(st));
  }
  return out;
}

std::vector<model::PaymentRecord> SqliteRepository::ListPaymentsByPayer(Transaction& t, const std::string& payer) {
  Statement st(TX(t).Handle(),
               "SELECT id,payer,amount,block_index,verified_at,registration_name FROM verified_payments WHERE payer=? ORDER BY id;");
  st.Text(1, payer);

  std::vector<model::PaymentRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadPayment(st));
  }
  return out;
}

// ------------------------------------------------------------------
// Subscriptions
// ------------------------------------------------------------------

Result SqliteRepository::InsertSubscription(Transaction& t, const model::SubscriptionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO subscriptions(user,registered_name,start_time,end_time,payment_id,is_active) VALUES(?,?,?,?,?,?);");
  st.Text(1, r.user).Text(2, r.registered_name).U64(3, r.start_time).U64(4, r.end_time).U64(5, r.payment_id).I32(6, r.is_active ? 1 : 0);
  return Translate(db, st.Step());
}

std::optional<model::SubscriptionRecord> SqliteRepository::GetSubscription(Transaction& t, const std::string& user) {
  Statement st(TX(t).Handle(), "SELECT user,registered_name,start_time,end_time,payment_id,is_active FROM subscriptions WHERE user=?;");
  st.Text(1, user);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadSubscription(st);
}

std::vector<model::SubscriptionRecord> SqliteRepository::ListSubscriptions(Transaction& t) {
  Statement st(TX(t).Handle(), "SELECT user,registered_name,start_time,end_time,payment_id,is_active FROM subscriptions ORDER BY user;");

  std::vector<model::SubscriptionRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadSubscription(st));
  }
  return out;
}

Result SqliteRepository::DeactivateAllSubscriptions(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE subscriptions SET is_active=0;");
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Content
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMetadata(Transaction& t, const model::MetadataRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO name_metadata(name,title,description,image,created_at,updated_at) VALUES(?,?,?,?,?,?)"
               " ON CONFLICT(name) DO UPDATE SET title=excluded.title, description=excluded.description, image=excluded.image,"
               " updated_at=excluded.updated_at;");
  st.Text(1, r.name).Text(2, r.title).Text(3, r.description).Text(4, r.image).U64(5, r.created_at).U64(6, r.updated_at);
  return Translate(db, st.Step());
}

std::optional<model::MetadataRecord> SqliteRepository::GetMetadata(Transaction& t, const std::string& name) {
  Statement st(TX(t).Handle(), "SELECT name,title,description,image,created_at,updated_at FROM name_metadata WHERE name=?;");
  st.Text(1, name);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::MetadataRecord r;
  r.name        = st.ColText(0);
  r.title       = st.ColText(1);
  r.description = st.ColText(2);
  r.image       = st.ColText(3);
  r.created_at  = st.ColU64(4);
  r.updated_at  = st.ColU64(5);
  return r;
}

Result SqliteRepository::UpsertMarkdown(Transaction& t, const model::MarkdownRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO name_markdown(name,content,updated_at) VALUES(?,?,?)"
               " ON CONFLICT(name) DO UPDATE SET content=excluded.content, updated_at=excluded.updated_at;");
  st.Text(1, r.name).Text(2, r.content).U64(3, r.updated_at);
  return Translate(db, st.Step());
}

std::optional<model::MarkdownRecord> SqliteRepository::GetMarkdown(Transaction& t, const std::string& name) {
  Statement st(TX(t).Handle(), "SELECT name,content,updated_at FROM name_markdown WHERE name=?;");
  st.Text(1, name);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return model::MarkdownRecord{st.ColText(0), st.ColText(1), st.ColU64(2)};
}

} // namespace registry::db::sqlite
