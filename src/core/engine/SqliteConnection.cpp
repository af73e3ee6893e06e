// src/core/engine/SqliteConnection.cpp
#include "SqliteConnection.hpp"
#include "core/error/StoreError.hpp"
#include <sqlite3.h>
#include <cctype>
#include <utility>

namespace vts {

namespace {

[[noreturn]] void fail(sqlite3* db, const std::string& path, const std::string& what) {
  std::string msg = db ? sqlite3_errmsg(db) : "unknown error";
  throw StoreError(StoreErrc::EngineError, what + " failed on " + path + ": " + msg);
}

void bindAll(sqlite3* db, const std::string& path, sqlite3_stmt* st,
             const std::vector<Value>& params) {
  int i = 1;
  for (const auto& p : params) {
    int rc = SQLITE_OK;
    if (std::holds_alternative<std::nullptr_t>(p)) {
      rc = sqlite3_bind_null(st, i);
    } else if (const auto* n = std::get_if<int64_t>(&p)) {
      rc = sqlite3_bind_int64(st, i, *n);
    } else if (const auto* d = std::get_if<double>(&p)) {
      rc = sqlite3_bind_double(st, i, *d);
    } else {
      const auto& s = std::get<std::string>(p);
      rc = sqlite3_bind_text(st, i, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
    }
    if (rc != SQLITE_OK) fail(db, path, "bind parameter " + std::to_string(i));
    ++i;
  }
}

Value columnValue(sqlite3_stmt* st, int col) {
  switch (sqlite3_column_type(st, col)) {
    case SQLITE_INTEGER:
      return static_cast<int64_t>(sqlite3_column_int64(st, col));
    case SQLITE_FLOAT:
      return sqlite3_column_double(st, col);
    case SQLITE_NULL:
      return nullptr;
    default: {
      const auto* txt = reinterpret_cast<const char*>(sqlite3_column_text(st, col));
      int len = sqlite3_column_bytes(st, col);
      return txt ? std::string(txt, static_cast<size_t>(len)) : std::string();
    }
  }
}

} // namespace

std::unique_ptr<SqliteConnection> SqliteConnection::connect(const std::string& path,
                                                            OpenMode mode,
                                                            const ConnectionOptions& opts) {
  int flags = SQLITE_OPEN_READWRITE;
  if (mode == OpenMode::Create) flags |= SQLITE_OPEN_CREATE;

  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &db, flags, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
    // sqlite hands back a handle even when the open fails
    sqlite3_close_v2(db);
    throw StoreError(StoreErrc::EngineError, "Failed to open DB " + path + ": " + msg);
  }

  auto conn = std::make_unique<SqliteConnection>(Token{}, db, path);

  // Pragmas: integrity + lock wait + journaling. journal_mode touches the
  // file header, so a non-database file is rejected here.
  conn->exec("PRAGMA foreign_keys=ON;");
  conn->exec("PRAGMA busy_timeout=" + std::to_string(opts.busy_timeout_ms) + ";");
  conn->exec("PRAGMA journal_mode=" + opts.journal_mode + ";");
  return conn;
}

SqliteConnection::SqliteConnection(Token, void* db, std::string path)
  : db_(db), path_(std::move(path)) {}

SqliteConnection::~SqliteConnection() {
  if (db_) sqlite3_close_v2(static_cast<sqlite3*>(db_));
}

std::vector<Row> SqliteConnection::execute(const std::string& sql, const std::vector<Value>& params) {
  auto* db = static_cast<sqlite3*>(db_);
  if (!db) throw StoreError(StoreErrc::EngineError, "connection to " + path_ + " is closed");

  sqlite3_stmt* raw = nullptr;
  const char* tail = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, &tail) != SQLITE_OK) {
    fail(db, path_, "prepare");
  }
  std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)> st(raw, &sqlite3_finalize);
  std::vector<Row> rows;
  if (!st) return rows;  // blank statement

  // One statement per call; anything after it would be silently dropped.
  for (; tail && *tail; ++tail) {
    if (!std::isspace(static_cast<unsigned char>(*tail)) && *tail != ';') {
      throw StoreError(StoreErrc::EngineError,
                       "prepare failed on " + path_ + ": trailing text after statement: " + tail);
    }
  }

  bindAll(db, path_, st.get(), params);

  for (;;) {
    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) fail(db, path_, "step");
    const int n = sqlite3_column_count(st.get());
    Row row;
    row.reserve(static_cast<size_t>(n));
    for (int c = 0; c < n; ++c) row.push_back(columnValue(st.get(), c));
    rows.push_back(std::move(row));
  }
  return rows;
}

void SqliteConnection::exec(const std::string& script) {
  auto* db = static_cast<sqlite3*>(db_);
  if (!db) throw StoreError(StoreErrc::EngineError, "connection to " + path_ + " is closed");

  char* err = nullptr;
  if (sqlite3_exec(db, script.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StoreError(StoreErrc::EngineError, "SQLite exec failed on " + path_ + ": " + msg);
  }
}

void SqliteConnection::close() {
  auto* db = static_cast<sqlite3*>(db_);
  if (!db) return;
  db_ = nullptr;
  if (sqlite3_close_v2(db) != SQLITE_OK) {
    throw StoreError(StoreErrc::EngineError, "Failed to close DB " + path_);
  }
}

bool SqliteConnection::inTransaction() const {
  auto* db = static_cast<sqlite3*>(db_);
  return db && sqlite3_get_autocommit(db) == 0;
}

std::string quoteIdentifier(const std::string& name) {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back('"');
  for (char c : name) {
    if (c == '"') out.push_back('"');
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

int64_t asInt(const Value& v) {
  if (const auto* n = std::get_if<int64_t>(&v)) return *n;
  if (const auto* d = std::get_if<double>(&v)) return static_cast<int64_t>(*d);
  throw StoreError(StoreErrc::EngineError, "expected an integer column");
}

std::string asText(const Value& v) {
  if (const auto* s = std::get_if<std::string>(&v)) return *s;
  if (const auto* n = std::get_if<int64_t>(&v)) return std::to_string(*n);
  if (const auto* d = std::get_if<double>(&v)) return std::to_string(*d);
  return {};
}

} // namespace vts
