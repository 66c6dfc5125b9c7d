#pragma once

#include <string>
#include <vector>

namespace registry::db::sql {

/*
  Canonical registry schema.

  Both dialects describe the same tables:

    seasons            (id)
    name_records       (name, UNIQUE owner)
    roles              (principal)
    user_profiles      (principal)
    consumed_blocks    (block_index)
    verified_payments  (id, UNIQUE block_index)
    subscriptions      (user)
    name_metadata      (name)
    name_markdown      (name)
    registry_counters  (counter -> last assigned id)

  Times are unsigned nanoseconds stored in signed 64-bit columns.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS seasons (id INTEGER PRIMARY KEY, name TEXT NOT NULL, start_time INTEGER NOT NULL, end_time INTEGER NOT NULL, "
      "max_names INTEGER NOT NULL, min_name_length INTEGER NOT NULL, max_name_length INTEGER NOT NULL, price INTEGER NOT NULL, status INTEGER NOT "
      "NULL, created_at INTEGER NOT NULL, updated_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS name_records (name TEXT PRIMARY KEY, address TEXT NOT NULL, address_type INTEGER NOT NULL, owner TEXT NOT NULL "
      "UNIQUE, season_id INTEGER NOT NULL, created_at INTEGER NOT NULL, updated_at INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS name_records_season_idx ON name_records(season_id);",
      "CREATE TABLE IF NOT EXISTS roles (principal TEXT PRIMARY KEY, role INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS user_profiles (principal TEXT PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS consumed_blocks (block_index INTEGER PRIMARY KEY, consumed_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS verified_payments (id INTEGER PRIMARY KEY, payer TEXT NOT NULL, amount INTEGER NOT NULL, block_index INTEGER NOT "
      "NULL UNIQUE, verified_at INTEGER NOT NULL, registration_name TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS verified_payments_payer_idx ON verified_payments(payer);",
      "CREATE TABLE IF NOT EXISTS subscriptions (user TEXT PRIMARY KEY, registered_name TEXT NOT NULL, start_time INTEGER NOT NULL, end_time "
      "INTEGER NOT NULL, payment_id INTEGER NOT NULL, is_active INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS name_metadata (name TEXT PRIMARY KEY, title TEXT NOT NULL, description TEXT NOT NULL, image TEXT NOT NULL, "
      "created_at INTEGER NOT NULL, updated_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS name_markdown (name TEXT PRIMARY KEY, content TEXT NOT NULL, updated_at INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS registry_counters (counter TEXT PRIMARY KEY, value INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO registry_counters(counter,value) VALUES('season',0),('payment',0);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS seasons (id BIGINT PRIMARY KEY, name TEXT NOT NULL, start_time BIGINT NOT NULL, end_time BIGINT NOT NULL, "
      "max_names BIGINT NOT NULL, min_name_length BIGINT NOT NULL, max_name_length BIGINT NOT NULL, price BIGINT NOT NULL, status SMALLINT NOT "
      "NULL, created_at BIGINT NOT NULL, updated_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS name_records (name TEXT PRIMARY KEY, address TEXT NOT NULL, address_type SMALLINT NOT NULL, owner TEXT NOT NULL "
      "UNIQUE, season_id BIGINT NOT NULL, created_at BIGINT NOT NULL, updated_at BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS name_records_season_idx ON name_records(season_id);",
      "CREATE TABLE IF NOT EXISTS roles (principal TEXT PRIMARY KEY, role SMALLINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS user_profiles (principal TEXT PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS consumed_blocks (block_index BIGINT PRIMARY KEY, consumed_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS verified_payments (id BIGINT PRIMARY KEY, payer TEXT NOT NULL, amount BIGINT NOT NULL, block_index BIGINT NOT "
      "NULL UNIQUE, verified_at BIGINT NOT NULL, registration_name TEXT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS verified_payments_payer_idx ON verified_payments(payer);",
      "CREATE TABLE IF NOT EXISTS subscriptions (\"user\" TEXT PRIMARY KEY, registered_name TEXT NOT NULL, start_time BIGINT NOT NULL, end_time "
      "BIGINT NOT NULL, payment_id BIGINT NOT NULL, is_active BOOLEAN NOT NULL);",
      "CREATE TABLE IF NOT EXISTS name_metadata (name TEXT PRIMARY KEY, title TEXT NOT NULL, description TEXT NOT NULL, image TEXT NOT NULL, "
      "created_at BIGINT NOT NULL, updated_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS name_markdown (name TEXT PRIMARY KEY, content TEXT NOT NULL, updated_at BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS registry_counters (counter TEXT PRIMARY KEY, value BIGINT NOT NULL);",
      "INSERT INTO registry_counters(counter,value) VALUES('season',0),('payment',0) ON CONFLICT (counter) DO NOTHING;"};
  return kSchema;
}

} // namespace registry::db::sql
