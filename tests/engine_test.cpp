// SQLite adapter: parameter binding, typed rows, transactions.
#include "core/engine/SqliteConnection.hpp"
#include "core/engine/Transaction.hpp"
#include "fixtures.hpp"
#include "framework.hpp"

#include <string>
#include <variant>

using vts::OpenMode;
using vts::SqliteConnection;
using vts::StoreErrc;
using vts::test::error_of;

void test_engine_roundtrip_typed_values()
{
  vts::test::TempDir dir;
  auto conn = SqliteConnection::connect(dir.file("e.db"), OpenMode::Create);
  conn->execute("CREATE TABLE v(i INTEGER, r REAL, t TEXT, n TEXT)");
  conn->execute("INSERT INTO v VALUES (?, ?, ?, ?)",
                {int64_t{-5}, 2.5, std::string("text"), nullptr});

  auto rows = conn->execute("SELECT i, r, t, n FROM v");
  ASSERT_EQ(rows.size(), std::size_t{1});
  ASSERT_EQ(std::get<int64_t>(rows[0][0]), int64_t{-5});
  ASSERT_TRUE(std::get<double>(rows[0][1]) == 2.5);
  ASSERT_EQ(std::get<std::string>(rows[0][2]), std::string("text"));
  ASSERT_TRUE(std::holds_alternative<std::nullptr_t>(rows[0][3]));
  ASSERT_EQ(vts::asText(rows[0][0]), std::string("-5"));
}

void test_engine_open_existing_requires_file()
{
  vts::test::TempDir dir;
  ASSERT_TRUE(error_of([&] {
    SqliteConnection::connect(dir.file("absent.db"), OpenMode::Existing);
  }) == StoreErrc::EngineError);
}

void test_engine_rejects_trailing_statements()
{
  vts::test::TempDir dir;
  auto conn = SqliteConnection::connect(dir.file("tail.db"), OpenMode::Create);
  conn->execute("CREATE TABLE a(x INT);");
  ASSERT_TRUE(error_of([&] { conn->execute("CREATE TABLE b(x INT); DROP TABLE a"); }) ==
              StoreErrc::EngineError);
  auto rows = conn->execute("SELECT name FROM sqlite_master WHERE name = 'a'");
  ASSERT_EQ(rows.size(), std::size_t{1});
}

void test_transaction_rolls_back_on_scope_exit()
{
  vts::test::TempDir dir;
  auto conn = SqliteConnection::connect(dir.file("tx.db"), OpenMode::Create);
  conn->execute("CREATE TABLE t(x INT)");
  {
    vts::Transaction tx(*conn);
    ASSERT_TRUE(conn->inTransaction());
    conn->execute("INSERT INTO t VALUES (1)");
  }
  ASSERT_FALSE(conn->inTransaction());
  ASSERT_EQ(vts::asInt(conn->execute("SELECT COUNT(*) FROM t").at(0).at(0)), int64_t{0});

  {
    vts::Transaction tx(*conn);
    conn->execute("INSERT INTO t VALUES (2)");
    tx.commit();
    ASSERT_FALSE(tx.active());
  }
  ASSERT_EQ(vts::asInt(conn->execute("SELECT COUNT(*) FROM t").at(0).at(0)), int64_t{1});
}

void test_engine_close_is_idempotent()
{
  vts::test::TempDir dir;
  auto conn = SqliteConnection::connect(dir.file("c.db"), OpenMode::Create);
  conn->close();
  conn->close();
  ASSERT_TRUE(error_of([&] { conn->execute("SELECT 1"); }) == StoreErrc::EngineError);
}

void test_quote_identifier()
{
  ASSERT_EQ(vts::quoteIdentifier("people"), std::string("\"people\""));
  ASSERT_EQ(vts::quoteIdentifier("a\"b"), std::string("\"a\"\"b\""));
}
