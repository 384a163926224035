#include "SQLite.hpp"

#include <stdexcept>

#include <sqlite3.h>

#include <glog/logging.h>

#include <fmt/format.h>

namespace SQLite {

namespace Config {
constexpr int busy_timeout_ms = 10'000;
}

DB::DB(std::string const& path)
  : path_(path)
{
  auto const flags
      = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    auto const msg = fmt::format("unable to open {}: {}", path,
                                 db_ ? sqlite3_errmsg(db_) : "out of memory");
    sqlite3_close(db_);
    throw std::runtime_error(msg);
  }
  sqlite3_busy_timeout(db_, Config::busy_timeout_ms);
  exec("PRAGMA foreign_keys = ON");
  if (path != ":memory:")
    exec("PRAGMA journal_mode = WAL");
}

DB::~DB()
{
  if (sqlite3_close(db_) != SQLITE_OK) {
    LOG(WARNING) << "sqlite3_close(" << path_ << "): " << sqlite3_errmsg(db_);
  }
}

void DB::throw_error(char const* what) const
{
  throw std::runtime_error(
      fmt::format("{}: {} ({})", what, sqlite3_errmsg(db_), path_));
}

void DB::exec(char const* sql)
{
  char* errmsg = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
    auto const msg = fmt::format("{} ({})", errmsg ? errmsg : "?", path_);
    sqlite3_free(errmsg);
    throw std::runtime_error(msg);
  }
}

int64_t DB::last_insert_rowid() const { return sqlite3_last_insert_rowid(db_); }

int DB::changes() const { return sqlite3_changes(db_); }

bool DB::in_transaction() const { return sqlite3_get_autocommit(db_) == 0; }

Stmt::Stmt(DB& db, char const* sql)
  : db_(db)
{
  if (sqlite3_prepare_v2(db_.get(), sql, -1, &stmt_, nullptr) != SQLITE_OK) {
    db_.throw_error(sql);
  }
}

Stmt::~Stmt() { sqlite3_finalize(stmt_); }

Stmt& Stmt::bind(int idx, int64_t value)
{
  if (sqlite3_bind_int64(stmt_, idx, value) != SQLITE_OK)
    db_.throw_error("sqlite3_bind_int64");
  return *this;
}

Stmt& Stmt::bind(int idx, double value)
{
  if (sqlite3_bind_double(stmt_, idx, value) != SQLITE_OK)
    db_.throw_error("sqlite3_bind_double");
  return *this;
}

Stmt& Stmt::bind(int idx, std::string_view value)
{
  if (sqlite3_bind_text(stmt_, idx, value.data(),
                        static_cast<int>(value.size()), SQLITE_TRANSIENT)
      != SQLITE_OK)
    db_.throw_error("sqlite3_bind_text");
  return *this;
}

Stmt& Stmt::bind(int idx, std::nullopt_t)
{
  if (sqlite3_bind_null(stmt_, idx) != SQLITE_OK)
    db_.throw_error("sqlite3_bind_null");
  return *this;
}

Stmt& Stmt::bind(int idx, std::optional<std::string> const& value)
{
  if (value)
    return bind(idx, std::string_view{*value});
  return bind(idx, std::nullopt);
}

Stmt& Stmt::bind(int idx, std::optional<int64_t> const& value)
{
  if (value)
    return bind(idx, *value);
  return bind(idx, std::nullopt);
}

bool Stmt::step()
{
  switch (sqlite3_step(stmt_)) {
  case SQLITE_ROW: return true;
  case SQLITE_DONE: return false;
  default: break;
  }
  db_.throw_error(sqlite3_sql(stmt_));
}

void Stmt::run()
{
  while (step())
    ;
}

void Stmt::reset()
{
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);
}

bool Stmt::is_null(int col) const
{
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

int64_t Stmt::int64(int col) const { return sqlite3_column_int64(stmt_, col); }

double Stmt::real(int col) const { return sqlite3_column_double(stmt_, col); }

std::string Stmt::text(int col) const
{
  auto const p = sqlite3_column_text(stmt_, col);
  if (p == nullptr)
    return "";
  auto const n = sqlite3_column_bytes(stmt_, col);
  return std::string(reinterpret_cast<char const*>(p),
                     static_cast<size_t>(n));
}

std::optional<std::string> Stmt::opt_text(int col) const
{
  if (is_null(col))
    return {};
  return text(col);
}

std::optional<int64_t> Stmt::opt_int64(int col) const
{
  if (is_null(col))
    return {};
  return int64(col);
}

Transaction::Transaction(DB& db)
  : db_(db)
  , nested_(db.in_transaction())
{
  db_.exec(nested_ ? "SAVEPOINT vrfy_tx" : "BEGIN IMMEDIATE");
}

Transaction::~Transaction()
{
  if (done_)
    return;
  auto const sql
      = nested_ ? "ROLLBACK TO vrfy_tx; RELEASE vrfy_tx" : "ROLLBACK";
  char* errmsg = nullptr;
  if (sqlite3_exec(db_.get(), sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
    LOG(ERROR) << "rollback failed: " << (errmsg ? errmsg : "?");
    sqlite3_free(errmsg);
  }
}

void Transaction::commit()
{
  db_.exec(nested_ ? "RELEASE vrfy_tx" : "COMMIT");
  done_ = true;
}

} // namespace SQLite
