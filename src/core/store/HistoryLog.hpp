#pragma once
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace vts {

class SqliteConnection;

enum class HistoryKind { Message, Warning, Error, Version };

const char* to_string(HistoryKind kind);
// Throws StoreError(EngineError) on an unrecognised type string.
HistoryKind parseHistoryKind(const std::string& text);

struct HistoryEntry {
  int64_t     seq;    // rowid, i.e. insertion order
  int64_t     time;   // seconds since epoch
  HistoryKind kind;
  std::string event;
};

// Seconds since epoch.
using Clock = std::function<int64_t()>;
Clock systemClock();

// Append-only event table living in the store file. Every append is its own
// autocommit statement unless the caller already holds a transaction.
class HistoryLog {
public:
  static constexpr const char* kTableName = "history";

  HistoryLog(SqliteConnection& conn, Clock clock);

  void createTable();
  void append(HistoryKind kind, const std::string& event);

  // Newest version entry by (time, seq). Throws NoVersionRecorded when empty.
  std::string resolveVersion() const;

  std::vector<HistoryEntry> entries() const;

private:
  SqliteConnection& conn_;
  Clock clock_;
};

} // namespace vts
