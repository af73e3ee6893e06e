#include "HistoryLog.hpp"
#include "core/engine/SqliteConnection.hpp"
#include "core/error/StoreError.hpp"
#include <ctime>
#include <utility>

namespace vts {

const char* to_string(HistoryKind kind) {
  switch (kind) {
    case HistoryKind::Message: return "message";
    case HistoryKind::Warning: return "warning";
    case HistoryKind::Error:   return "error";
    case HistoryKind::Version: return "version";
  }
  return "message";
}

HistoryKind parseHistoryKind(const std::string& text) {
  if (text == "message") return HistoryKind::Message;
  if (text == "warning") return HistoryKind::Warning;
  if (text == "error")   return HistoryKind::Error;
  if (text == "version") return HistoryKind::Version;
  throw StoreError(StoreErrc::EngineError, "unrecognised history type '" + text + "'");
}

Clock systemClock() {
  return [] { return static_cast<int64_t>(std::time(nullptr)); };
}

HistoryLog::HistoryLog(SqliteConnection& conn, Clock clock)
  : conn_(conn), clock_(clock ? std::move(clock) : systemClock()) {}

void HistoryLog::createTable() {
  // Layout is shared with files written by earlier tools; ordering relies on
  // the implicit rowid instead of an extra column.
  conn_.execute("CREATE TABLE history(time INT, type TEXT, event TEXT)");
}

void HistoryLog::append(HistoryKind kind, const std::string& event) {
  conn_.execute("INSERT INTO history (time, type, event) VALUES (?, ?, ?)",
                {clock_(), std::string(to_string(kind)), event});
}

std::string HistoryLog::resolveVersion() const {
  auto rows = conn_.execute(
    "SELECT event FROM history WHERE type = ? ORDER BY time DESC, rowid DESC LIMIT 1",
    {std::string(to_string(HistoryKind::Version))});
  if (rows.empty()) {
    throw StoreError(StoreErrc::NoVersionRecorded,
                     "no version recorded in " + conn_.path());
  }
  return asText(rows.front().at(0));
}

std::vector<HistoryEntry> HistoryLog::entries() const {
  auto rows = conn_.execute("SELECT rowid, time, type, event FROM history ORDER BY rowid");
  std::vector<HistoryEntry> out;
  out.reserve(rows.size());
  for (const auto& r : rows) {
    out.push_back(HistoryEntry{asInt(r.at(0)), asInt(r.at(1)),
                               parseHistoryKind(asText(r.at(2))), asText(r.at(3))});
  }
  return out;
}

} // namespace vts
