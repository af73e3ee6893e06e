#pragma once
#include "HistoryLog.hpp"
#include "core/confirm/ConfirmationGate.hpp"
#include "core/engine/SqliteConnection.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spdlog {
class logger;
namespace sinks { class sink; }
}

namespace vts {

// Result of an operation guarded by the confirmation gate.
enum class Outcome { Applied, Declined };

// One versioned store file: an SQLite database with a reserved append-only
// `history` table next to caller-defined tables.
//
// Closed -> Open via open()/create(); Open -> Closed via close(). Any other
// transition throws StoreError (AlreadyOpen / NotOpen) and changes nothing.
class Store {
public:
  explicit Store(int verbosity = 0,
                 ConfirmFn gate = nullptr,
                 ConnectionOptions opts = {},
                 Clock clock = nullptr);
  ~Store();

  Store(const Store&) = delete;
  Store& operator=(const Store&) = delete;

  // -- lifecycle --
  void open(const std::string& path);
  // An existing file at path is replaced only if force or the gate agrees.
  Outcome create(const std::string& path,
                 const std::string& version,
                 bool force = false,
                 const ConfirmFn& confirm = nullptr);
  void close();

  bool isOpen() const { return conn_ != nullptr; }
  const std::string& path() const { return path_; }
  // nullopt while no store is open.
  const std::optional<std::string>& version() const { return version_; }

  // -- tables --
  // columns is inserted verbatim, e.g. "Id INT, Name TEXT, Price INT".
  Outcome addTable(const std::string& name,
                   const std::string& columns,
                   bool force = false,
                   const ConfirmFn& confirm = nullptr);
  Outcome dropTable(const std::string& name,
                    bool force = false,
                    const ConfirmFn& confirm = nullptr);
  bool tableExists(const std::string& name);
  std::vector<std::string> listTables();

  // -- history --
  void logMessage(const std::string& message);
  void logWarning(const std::string& warning);
  void logError(const std::string& error);
  void logVersion(const std::string& version);
  std::string resolveVersion();
  std::vector<HistoryEntry> history();

  // Raw access for row-level import/export.
  SqliteConnection& connection();

  // <0 = warnings only, 0 = progress, 1+ = debug
  void setVerbosity(int verbosity);
  int verbosity() const { return verbosity_; }
  // nullptr restores the shared stderr sink.
  void setLogSink(std::shared_ptr<spdlog::sinks::sink> sink);
  void setConfirmationGate(ConfirmFn gate);

private:
  void requireOpen(const char* op) const;
  void requireClosed(const char* op) const;
  void checkTableName(const std::string& name) const;
  bool confirm(const ConfirmFn& perCall, const std::string& entity, EntityKind kind) const;
  HistoryLog historyLog();

  std::unique_ptr<SqliteConnection> conn_;
  std::string path_;
  std::optional<std::string> version_;
  int verbosity_;
  ConfirmFn gate_;
  ConnectionOptions opts_;
  Clock clock_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace vts
