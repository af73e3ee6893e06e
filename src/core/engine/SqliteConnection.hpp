#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace vts {

// A single bound parameter or result column.
using Value = std::variant<std::nullptr_t, int64_t, double, std::string>;
using Row = std::vector<Value>;

enum class OpenMode {
  Existing,  // fail if the file is missing
  Create     // create the file if needed
};

struct ConnectionOptions {
  std::string journal_mode = "DELETE";
  int         busy_timeout_ms = 5000;
};

// Owns one sqlite3 handle. Every failure is raised as
// StoreError(StoreErrc::EngineError) carrying sqlite3_errmsg.
class SqliteConnection {
  struct Token {};

public:
  static std::unique_ptr<SqliteConnection> connect(const std::string& path,
                                                   OpenMode mode,
                                                   const ConnectionOptions& opts = {});
  // Reachable only through connect().
  SqliteConnection(Token, void* db, std::string path);
  ~SqliteConnection();

  SqliteConnection(const SqliteConnection&) = delete;
  SqliteConnection& operator=(const SqliteConnection&) = delete;

  // Prepares sql, binds params positionally (?1, ?2, ...) and steps to completion.
  std::vector<Row> execute(const std::string& sql, const std::vector<Value>& params = {});

  // Runs a parameterless script (may hold several statements).
  void exec(const std::string& script);

  // Releases the handle. Safe to call twice; the second call is a no-op.
  void close();

  bool inTransaction() const;
  const std::string& path() const { return path_; }

private:
  void* db_;  // sqlite3*
  std::string path_;
};

// Double-quotes an identifier so it can be spliced into DDL.
std::string quoteIdentifier(const std::string& name);

// Convenience accessors for result columns.
int64_t asInt(const Value& v);
std::string asText(const Value& v);

} // namespace vts
