#include "CounterStore.hpp"

#include "SQLite.hpp"

namespace {
std::time_t expiry(std::time_t now, std::chrono::seconds ttl)
{
  return ttl.count() > 0 ? now + ttl.count() : 0;
}
} // namespace

MemoryCounterStore::Entry* MemoryCounterStore::live_(std::string const& key,
                                                     std::time_t        now)
{
  auto const it = map_.find(key);
  if (it == map_.end())
    return nullptr;
  if (it->second.expires && it->second.expires <= now) {
    map_.erase(it);
    return nullptr;
  }
  return &it->second;
}

bool MemoryCounterStore::try_acquire(std::string const&   key,
                                     int64_t              limit,
                                     std::chrono::seconds ttl)
{
  std::lock_guard<std::mutex> lock(mtx_);
  auto const                  now = clock_();
  auto                        e   = live_(key, now);
  auto const                  cur = e ? e->value : 0;
  if (cur >= limit)
    return false;
  map_[key] = Entry{cur + 1, expiry(now, ttl)};
  return true;
}

void MemoryCounterStore::decrement(std::string const&   key,
                                   std::chrono::seconds ttl)
{
  std::lock_guard<std::mutex> lock(mtx_);
  auto const                  now = clock_();
  auto                        e   = live_(key, now);
  if (!e)
    return;
  if (e->value <= 1) {
    map_.erase(key);
    return;
  }
  e->value -= 1;
  e->expires = expiry(now, ttl);
}

int64_t MemoryCounterStore::increment(std::string const&   key,
                                      std::chrono::seconds ttl)
{
  std::lock_guard<std::mutex> lock(mtx_);
  auto const                  now = clock_();
  if (auto e = live_(key, now); e) {
    return ++e->value;
  }
  map_[key] = Entry{1, expiry(now, ttl)};
  return 1;
}

std::optional<int64_t> MemoryCounterStore::get(std::string const& key)
{
  std::lock_guard<std::mutex> lock(mtx_);
  if (auto e = live_(key, clock_()); e)
    return e->value;
  return {};
}

void MemoryCounterStore::put(std::string const&   key,
                             int64_t              value,
                             std::chrono::seconds ttl)
{
  std::lock_guard<std::mutex> lock(mtx_);
  map_[key] = Entry{value, expiry(clock_(), ttl)};
}

void MemoryCounterStore::erase(std::string const& key)
{
  std::lock_guard<std::mutex> lock(mtx_);
  map_.erase(key);
}

/////////////////////////////////////////////////////////////////////////////

SQLiteCounterStore::SQLiteCounterStore(SQLite::DB& db, Clock clock)
  : db_(db)
  , clock_(std::move(clock))
{
  db_.exec("CREATE TABLE IF NOT EXISTS counters ("
           "  key        TEXT PRIMARY KEY,"
           "  value      INTEGER NOT NULL,"
           "  expires_at INTEGER NOT NULL DEFAULT 0"
           ")");
}

std::optional<int64_t> SQLiteCounterStore::live_(std::string const& key,
                                                 std::time_t        now)
{
  SQLite::Stmt sel(db_, "SELECT value, expires_at FROM counters WHERE key = ?");
  sel.bind(1, key);
  if (!sel.step())
    return {};
  auto const value   = sel.int64(0);
  auto const expires = sel.int64(1);
  if (expires && expires <= now) {
    SQLite::Stmt del(db_, "DELETE FROM counters WHERE key = ?");
    del.bind(1, key).run();
    return {};
  }
  return value;
}

bool SQLiteCounterStore::try_acquire(std::string const&   key,
                                     int64_t              limit,
                                     std::chrono::seconds ttl)
{
  SQLite::Transaction tx(db_);
  auto const          now = clock_();
  auto const          cur = live_(key, now).value_or(0);
  if (cur >= limit)
    return false;

  SQLite::Stmt up(db_, "INSERT INTO counters (key, value, expires_at) "
                       "VALUES (?1, ?2, ?3) ON CONFLICT(key) DO UPDATE SET "
                       "value = excluded.value, expires_at = excluded.expires_at");
  up.bind(1, key).bind(2, cur + 1).bind(3, int64_t{expiry(now, ttl)}).run();
  tx.commit();
  return true;
}

void SQLiteCounterStore::decrement(std::string const&   key,
                                   std::chrono::seconds ttl)
{
  SQLite::Transaction tx(db_);
  auto const          now = clock_();
  auto const          cur = live_(key, now);
  if (!cur) {
    tx.commit();
    return;
  }
  if (*cur <= 1) {
    erase(key);
  }
  else {
    SQLite::Stmt up(db_,
                    "UPDATE counters SET value = ?2, expires_at = ?3 WHERE key = ?1");
    up.bind(1, key).bind(2, *cur - 1).bind(3, int64_t{expiry(now, ttl)}).run();
  }
  tx.commit();
}

int64_t SQLiteCounterStore::increment(std::string const&   key,
                                      std::chrono::seconds ttl)
{
  SQLite::Transaction tx(db_);
  auto const          now  = clock_();
  auto const          cur  = live_(key, now);
  int64_t             next = 1;
  if (cur) {
    next = *cur + 1;
    SQLite::Stmt up(db_, "UPDATE counters SET value = ?2 WHERE key = ?1");
    up.bind(1, key).bind(2, next).run();
  }
  else {
    SQLite::Stmt ins(db_, "INSERT INTO counters (key, value, expires_at) "
                          "VALUES (?1, 1, ?2)");
    ins.bind(1, key).bind(2, int64_t{expiry(now, ttl)}).run();
  }
  tx.commit();
  return next;
}

std::optional<int64_t> SQLiteCounterStore::get(std::string const& key)
{
  return live_(key, clock_());
}

void SQLiteCounterStore::put(std::string const&   key,
                             int64_t              value,
                             std::chrono::seconds ttl)
{
  SQLite::Stmt up(db_, "INSERT INTO counters (key, value, expires_at) "
                       "VALUES (?1, ?2, ?3) ON CONFLICT(key) DO UPDATE SET "
                       "value = excluded.value, expires_at = excluded.expires_at");
  up.bind(1, key).bind(2, value).bind(3, int64_t{expiry(clock_(), ttl)}).run();
}

void SQLiteCounterStore::erase(std::string const& key)
{
  SQLite::Stmt del(db_, "DELETE FROM counters WHERE key = ?");
  del.bind(1, key).run();
}
