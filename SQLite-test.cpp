#include "SQLite.hpp"

#include <stdexcept>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  SQLite::DB db{":memory:"};
  db.exec("CREATE TABLE t (id INTEGER PRIMARY KEY, name TEXT, score REAL)");

  SQLite::Stmt{db, "INSERT INTO t (name, score) VALUES (?, ?)"}
      .bind(1, "one")
      .bind(2, 1.5)
      .run();
  CHECK_EQ(db.last_insert_rowid(), 1);
  SQLite::Stmt{db, "INSERT INTO t (name, score) VALUES (?, ?)"}
      .bind(1, std::nullopt)
      .bind(2, std::optional<int64_t>{})
      .run();
  CHECK_EQ(db.changes(), 1);

  SQLite::Stmt stmt{db, "SELECT id, name, score FROM t ORDER BY id"};
  CHECK(stmt.step());
  CHECK_EQ(stmt.int64(0), 1);
  CHECK_EQ(stmt.text(1), "one");
  CHECK_EQ(stmt.real(2), 1.5);
  CHECK(stmt.step());
  CHECK(stmt.is_null(1));
  CHECK(!stmt.opt_text(1));
  CHECK(!stmt.opt_int64(2));
  CHECK_EQ(stmt.text(1), "");
  CHECK(!stmt.step());

  // Rolled back unless committed; nested ones are savepoints.
  {
    SQLite::Transaction outer{db};
    CHECK(db.in_transaction());
    SQLite::Stmt{db, "DELETE FROM t WHERE id = 1"}.run();
    {
      SQLite::Transaction inner{db};
      SQLite::Stmt{db, "DELETE FROM t"}.run();
    }
    SQLite::Stmt count{db, "SELECT COUNT(*) FROM t"};
    CHECK(count.step());
    CHECK_EQ(count.int64(0), 1);
  }
  CHECK(!db.in_transaction());
  {
    SQLite::Stmt count{db, "SELECT COUNT(*) FROM t"};
    CHECK(count.step());
    CHECK_EQ(count.int64(0), 2);
  }
  {
    SQLite::Transaction tx{db};
    SQLite::Stmt{db, "DELETE FROM t WHERE id = 2"}.run();
    tx.commit();
  }
  {
    SQLite::Stmt count{db, "SELECT COUNT(*) FROM t"};
    CHECK(count.step());
    CHECK_EQ(count.int64(0), 1);
  }

  auto threw = false;
  try {
    SQLite::Stmt{db, "SELECT nope FROM t"};
  }
  catch (std::runtime_error const& e) {
    threw = true;
    LOG(INFO) << e.what();
  }
  CHECK(threw);

  LOG(INFO) << "SQLite-test passed";
}
