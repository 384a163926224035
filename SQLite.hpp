#ifndef SQLITE_DOT_HPP
#define SQLITE_DOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

struct sqlite3;
struct sqlite3_stmt;

namespace SQLite {

// An open database connection.  Failures throw std::runtime_error
// carrying the SQLite message.

class DB {
public:
  DB(DB const&) = delete;
  DB& operator=(DB const&) = delete;

  explicit DB(std::string const& path);
  ~DB();

  sqlite3*           get() const { return db_; }
  std::string const& path() const { return path_; }

  void    exec(char const* sql);
  int64_t last_insert_rowid() const;
  int     changes() const;
  bool    in_transaction() const;

  [[noreturn]] void throw_error(char const* what) const;

private:
  sqlite3*    db_{nullptr};
  std::string path_;
};

class Stmt {
public:
  Stmt(Stmt const&) = delete;
  Stmt& operator=(Stmt const&) = delete;

  Stmt(DB& db, char const* sql);
  ~Stmt();

  // Parameters are numbered from 1.
  Stmt& bind(int idx, int64_t value);
  Stmt& bind(int idx, int value) { return bind(idx, int64_t{value}); }
  Stmt& bind(int idx, double value);
  Stmt& bind(int idx, std::string_view value);
  Stmt& bind(int idx, char const* value)
  {
    return bind(idx, std::string_view{value});
  }
  Stmt& bind(int idx, std::string const& value)
  {
    return bind(idx, std::string_view{value});
  }
  Stmt& bind(int idx, std::nullopt_t);
  Stmt& bind(int idx, std::optional<std::string> const& value);
  Stmt& bind(int idx, std::optional<int64_t> const& value);

  // Returns true while there is a row.
  bool step();
  // Step to completion, for statements with no result rows.
  void run();
  void reset();

  // Columns are numbered from 0.
  bool                       is_null(int col) const;
  int64_t                    int64(int col) const;
  double                     real(int col) const;
  std::string                text(int col) const;
  std::optional<std::string> opt_text(int col) const;
  std::optional<int64_t>     opt_int64(int col) const;

private:
  DB&           db_;
  sqlite3_stmt* stmt_{nullptr};
};

// BEGIN IMMEDIATE takes the write lock up front so two processes never
// deadlock upgrading read locks.  Nested use becomes a savepoint.
// Rolls back unless commit() is called.

class Transaction {
public:
  Transaction(Transaction const&) = delete;
  Transaction& operator=(Transaction const&) = delete;

  explicit Transaction(DB& db);
  ~Transaction();

  void commit();

private:
  DB&  db_;
  bool nested_;
  bool done_{false};
};

} // namespace SQLite

#endif // SQLITE_DOT_HPP
