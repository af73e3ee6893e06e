#include "Store.hpp"
#include "core/engine/Transaction.hpp"
#include "core/error/StoreError.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace vts {

namespace {

std::shared_ptr<spdlog::sinks::sink> sharedSink() {
  static auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  return sink;
}

spdlog::level::level_enum levelFor(int verbosity) {
  if (verbosity < 0) return spdlog::level::warn;
  if (verbosity == 0) return spdlog::level::info;
  return spdlog::level::debug;
}

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void ensure_dirs_for(const std::string& file_path) {
  fs::path parent = fs::path(file_path).parent_path();
  if (parent.empty()) return;
  std::error_code ec;
  fs::create_directories(parent, ec);
  if (ec) {
    throw StoreError(StoreErrc::EngineError,
                     "Cannot create directory " + parent.string() + ": " + ec.message());
  }
}

// Removes the database file and any journal files sqlite left beside it.
void removeStoreFile(const std::string& path, std::error_code& ec) {
  ec.clear();
  fs::remove(path, ec);
  if (ec) return;
  for (const char* suffix : {"-journal", "-wal", "-shm"}) {
    std::error_code ignored;
    fs::remove(path + suffix, ignored);
  }
}

} // namespace

Store::Store(int verbosity, ConfirmFn gate, ConnectionOptions opts, Clock clock)
  : verbosity_(verbosity),
    gate_(gate ? std::move(gate) : terminalPrompt(std::cin, std::cout)),
    opts_(std::move(opts)),
    clock_(clock ? std::move(clock) : systemClock()),
    log_(std::make_shared<spdlog::logger>("vts", sharedSink())) {
  log_->set_level(levelFor(verbosity_));
}

Store::~Store() {
  if (conn_) log_->debug("Releasing store {} without explicit close", path_);
}

// ---------- lifecycle ----------

void Store::open(const std::string& path) {
  requireClosed("open");
  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw StoreError(StoreErrc::NotFound, "File " + path + " could not be found");
  }

  // Nothing is assigned to *this until the version resolves; an exception
  // before that point destroys the local connection.
  auto conn = SqliteConnection::connect(path, OpenMode::Existing, opts_);
  std::string version = HistoryLog(*conn, clock_).resolveVersion();

  conn_ = std::move(conn);
  path_ = path;
  version_ = version;
  log_->info("File: {} (version: {}) opened successfully", path_, version);
}

Outcome Store::create(const std::string& path,
                      const std::string& version,
                      bool force,
                      const ConfirmFn& confirm) {
  requireClosed("create");

  std::error_code ec;
  if (fs::is_directory(path, ec)) {
    throw StoreError(StoreErrc::EngineError, "Cannot create store " + path + ": is a directory");
  }
  if (fs::exists(path, ec)) {
    if (!force && !this->confirm(confirm, path, EntityKind::StoreFile)) {
      log_->info("Create store {} operation cancelled", path);
      return Outcome::Declined;
    }
    log_->info("Deleting store file {}", path);
    removeStoreFile(path, ec);
    if (ec) {
      throw StoreError(StoreErrc::EngineError,
                       "Cannot remove existing file " + path + ": " + ec.message());
    }
  }
  ensure_dirs_for(path);

  std::unique_ptr<SqliteConnection> conn;
  try {
    conn = SqliteConnection::connect(path, OpenMode::Create, opts_);
    HistoryLog history(*conn, clock_);
    history.createTable();
    history.append(HistoryKind::Message, "file created");
    history.append(HistoryKind::Version, version);
  } catch (...) {
    conn.reset();
    std::error_code cleanup;
    removeStoreFile(path, cleanup);
    throw;
  }

  conn_ = std::move(conn);
  path_ = path;
  version_ = version;
  log_->info("File: {} (version: {}) created", path_, version);
  return Outcome::Applied;
}

void Store::close() {
  requireOpen("close");
  auto conn = std::move(conn_);
  const std::string path = std::move(path_);
  path_.clear();
  version_.reset();
  conn->close();
  log_->info("File: {} closed", path);
}

// ---------- tables ----------

Outcome Store::addTable(const std::string& name,
                        const std::string& columns,
                        bool force,
                        const ConfirmFn& confirm) {
  requireOpen("addTable");
  checkTableName(name);

  const bool exists = tableExists(name);
  if (exists && !force && !this->confirm(confirm, name, EntityKind::Table)) {
    log_->info("Add table {} operation cancelled", name);
    return Outcome::Declined;
  }

  try {
    Transaction tx(*conn_);
    conn_->execute("DROP TABLE IF EXISTS " + quoteIdentifier(name));
    conn_->execute("CREATE TABLE " + quoteIdentifier(name) + "(" + columns + ")");
    historyLog().append(HistoryKind::Message,
                        "table " + name + (exists ? " replaced" : " added"));
    tx.commit();
  } catch (const StoreError& e) {
    throw StoreError(StoreErrc::EngineError,
                     "addTable '" + name + "' in " + path_ + ": " + e.what());
  }
  log_->info("Table {} {} in {}", name, exists ? "replaced" : "added", path_);
  return Outcome::Applied;
}

Outcome Store::dropTable(const std::string& name, bool force, const ConfirmFn& confirm) {
  requireOpen("dropTable");
  checkTableName(name);

  if (!tableExists(name)) {
    log_->debug("Table {} not present in {}, nothing to drop", name, path_);
    return Outcome::Applied;
  }
  if (!force && !this->confirm(confirm, name, EntityKind::Table)) {
    log_->info("Drop table {} operation cancelled", name);
    return Outcome::Declined;
  }

  try {
    Transaction tx(*conn_);
    conn_->execute("DROP TABLE " + quoteIdentifier(name));
    historyLog().append(HistoryKind::Message, "table " + name + " dropped");
    tx.commit();
  } catch (const StoreError& e) {
    throw StoreError(StoreErrc::EngineError,
                     "dropTable '" + name + "' in " + path_ + ": " + e.what());
  }
  log_->info("Table {} dropped from {}", name, path_);
  return Outcome::Applied;
}

bool Store::tableExists(const std::string& name) {
  requireOpen("tableExists");
  auto rows = conn_->execute(
    "SELECT name FROM sqlite_master WHERE type = 'table' AND name = ? COLLATE NOCASE",
    {name});
  return !rows.empty();
}

std::vector<std::string> Store::listTables() {
  requireOpen("listTables");
  auto rows = conn_->execute(
    "SELECT name FROM sqlite_master WHERE type = 'table' "
    "AND name <> ? COLLATE NOCASE AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
    "ORDER BY name",
    {std::string(HistoryLog::kTableName)});
  std::vector<std::string> names;
  names.reserve(rows.size());
  for (const auto& r : rows) names.push_back(asText(r.at(0)));
  return names;
}

// ---------- history ----------

void Store::logMessage(const std::string& message) {
  requireOpen("logMessage");
  historyLog().append(HistoryKind::Message, message);
}

void Store::logWarning(const std::string& warning) {
  requireOpen("logWarning");
  historyLog().append(HistoryKind::Warning, warning);
}

void Store::logError(const std::string& error) {
  requireOpen("logError");
  historyLog().append(HistoryKind::Error, error);
}

void Store::logVersion(const std::string& version) {
  requireOpen("logVersion");
  historyLog().append(HistoryKind::Version, version);
  version_ = version;
}

std::string Store::resolveVersion() {
  requireOpen("resolveVersion");
  version_ = historyLog().resolveVersion();
  return *version_;
}

std::vector<HistoryEntry> Store::history() {
  requireOpen("history");
  return historyLog().entries();
}

SqliteConnection& Store::connection() {
  requireOpen("connection");
  return *conn_;
}

// ---------- settings ----------

void Store::setVerbosity(int verbosity) {
  verbosity_ = verbosity;
  log_->set_level(levelFor(verbosity_));
}

void Store::setLogSink(std::shared_ptr<spdlog::sinks::sink> sink) {
  log_ = std::make_shared<spdlog::logger>("vts", sink ? std::move(sink) : sharedSink());
  log_->set_level(levelFor(verbosity_));
}

void Store::setConfirmationGate(ConfirmFn gate) {
  gate_ = gate ? std::move(gate) : terminalPrompt(std::cin, std::cout);
}

// ---------- helpers ----------

void Store::requireOpen(const char* op) const {
  if (!conn_) {
    throw StoreError(StoreErrc::NotOpen, std::string(op) + ": no store file is open");
  }
}

void Store::requireClosed(const char* op) const {
  if (conn_) {
    throw StoreError(StoreErrc::AlreadyOpen,
                     std::string(op) + ": store file " + path_ + " is already open");
  }
}

void Store::checkTableName(const std::string& name) const {
  if (name.empty()) {
    throw StoreError(StoreErrc::InvalidName, "table name must not be empty");
  }
  const std::string key = lower(name);
  if (key == HistoryLog::kTableName) {
    throw StoreError(StoreErrc::InvalidName, "table name 'history' is reserved");
  }
  if (key.rfind("sqlite_", 0) == 0) {
    throw StoreError(StoreErrc::InvalidName,
                     "table name '" + name + "' uses the engine's reserved prefix");
  }
}

bool Store::confirm(const ConfirmFn& perCall, const std::string& entity, EntityKind kind) const {
  const ConfirmFn& gate = perCall ? perCall : gate_;
  return gate && gate(entity, kind);
}

HistoryLog Store::historyLog() {
  return HistoryLog(*conn_, clock_);
}

} // namespace vts
