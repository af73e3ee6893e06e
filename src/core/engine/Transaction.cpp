#include "Transaction.hpp"
#include "SqliteConnection.hpp"
#include "core/error/StoreError.hpp"
#include <spdlog/spdlog.h>

namespace vts {

Transaction::Transaction(SqliteConnection& conn) : conn_(conn), active_(false) {
  conn_.exec("BEGIN IMMEDIATE;");
  active_ = true;
}

Transaction::~Transaction() {
  if (!active_) return;
  try {
    rollback();
  } catch (const StoreError& e) {
    spdlog::warn("rollback on {} failed: {}", conn_.path(), e.what());
  }
}

void Transaction::commit() {
  conn_.exec("COMMIT;");
  active_ = false;
}

void Transaction::rollback() {
  active_ = false;
  // sqlite may already have rolled back on its own (e.g. after SQLITE_FULL)
  if (!conn_.inTransaction()) return;
  conn_.exec("ROLLBACK;");
}

} // namespace vts
