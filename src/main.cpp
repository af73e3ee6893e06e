// src/main.cpp
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/config/StoreConfig.hpp"
#include "core/confirm/ConfirmationGate.hpp"
#include "core/error/StoreError.hpp"
#include "core/store/Store.hpp"

using nlohmann::json;

// ---------- helpers ----------

struct Args {
  std::optional<std::string> configPath;
  std::optional<int> verbosity;
  std::optional<vts::GatePolicy> gate;
  bool force = false;
  bool asJson = false;
  std::vector<std::string> positional;  // command first
};

class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " [options] create <file> <version> [--force]\n"
            << "  " << argv0 << " [options] info <file>\n"
            << "  " << argv0 << " [options] history <file> [--json]\n"
            << "  " << argv0 << " [options] add-table <file> <name> <columns> [--force]\n"
            << "  " << argv0 << " [options] drop-table <file> <name> [--force]\n"
            << "  " << argv0 << " [options] log <file> <message|warning|error|version> <text>\n"
            << "Options:\n"
            << "  --config FILE   JSON settings (default: $VTS_CONFIG)\n"
            << "  -v, -vv, -q     debug output / debug plus settings / warnings only\n"
            << "  --yes, --no     answer overwrite questions without prompting\n";
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) throw UsageError("--config needs a file argument");
      a.configPath = argv[++i];
    } else if (arg == "-v") {
      a.verbosity = 1;
    } else if (arg == "-vv") {
      a.verbosity = 2;
    } else if (arg == "-q") {
      a.verbosity = -1;
    } else if (arg == "--yes") {
      a.gate = vts::GatePolicy::Allow;
    } else if (arg == "--no") {
      a.gate = vts::GatePolicy::Deny;
    } else if (arg == "--force") {
      a.force = true;
    } else if (arg == "--json") {
      a.asJson = true;
    } else if (arg == "--help" || arg == "-h") {
      a.positional = {"help"};
      return a;
    } else {
      a.positional.push_back(arg);
    }
  }
  return a;
}

static void require_args(const Args& a, size_t n, const char* usage) {
  if (a.positional.size() != n) throw UsageError(std::string("usage: ") + usage);
}

static vts::ConfirmFn gate_for(vts::GatePolicy policy) {
  switch (policy) {
    case vts::GatePolicy::Allow: return vts::alwaysAllow();
    case vts::GatePolicy::Deny:  return vts::alwaysDeny();
    case vts::GatePolicy::Prompt: break;
  }
  return vts::terminalPrompt(std::cin, std::cout);
}

static std::string format_time(int64_t secs) {
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
#ifdef _WIN32
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return os.str();
}

static int declined(const std::string& what) {
  std::cout << what << " cancelled\n";
  return 1;
}

// ---------- commands ----------

static int cmd_create(vts::Store& store, const Args& a) {
  require_args(a, 3, "create <file> <version> [--force]");
  const std::string& file = a.positional[1];
  if (store.create(file, a.positional[2], a.force) == vts::Outcome::Declined) {
    return declined("create " + file);
  }
  std::cout << "Store created at: " << file << " (version " << *store.version() << ")\n";
  store.close();
  return 0;
}

static int cmd_info(vts::Store& store, const Args& a) {
  require_args(a, 2, "info <file>");
  store.open(a.positional[1]);
  std::cout << "file:    " << store.path() << "\n"
            << "version: " << *store.version() << "\n"
            << "tables:\n";
  for (const auto& t : store.listTables()) {
    auto rows = store.connection().execute("SELECT COUNT(*) FROM " + vts::quoteIdentifier(t));
    std::cout << "  " << t << " (" << vts::asInt(rows.at(0).at(0)) << " rows)\n";
  }
  store.close();
  return 0;
}

static int cmd_history(vts::Store& store, const Args& a) {
  require_args(a, 2, "history <file> [--json]");
  store.open(a.positional[1]);
  const auto entries = store.history();
  store.close();

  if (a.asJson) {
    json out = json::array();
    for (const auto& e : entries) {
      out.push_back(json{{"seq", e.seq},
                         {"time", e.time},
                         {"type", vts::to_string(e.kind)},
                         {"event", e.event}});
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }
  for (const auto& e : entries) {
    std::cout << format_time(e.time) << "  " << std::left << std::setw(8)
              << vts::to_string(e.kind) << " " << e.event << "\n";
  }
  return 0;
}

static int cmd_add_table(vts::Store& store, const Args& a) {
  require_args(a, 4, "add-table <file> <name> <columns> [--force]");
  store.open(a.positional[1]);
  const std::string& name = a.positional[2];
  auto outcome = store.addTable(name, a.positional[3], a.force);
  store.close();
  if (outcome == vts::Outcome::Declined) return declined("add table " + name);
  std::cout << "Table " << name << " ready\n";
  return 0;
}

static int cmd_drop_table(vts::Store& store, const Args& a) {
  require_args(a, 3, "drop-table <file> <name> [--force]");
  store.open(a.positional[1]);
  const std::string& name = a.positional[2];
  auto outcome = store.dropTable(name, a.force);
  store.close();
  if (outcome == vts::Outcome::Declined) return declined("drop table " + name);
  std::cout << "Table " << name << " dropped\n";
  return 0;
}

static int cmd_log(vts::Store& store, const Args& a) {
  require_args(a, 4, "log <file> <message|warning|error|version> <text>");
  vts::HistoryKind kind = vts::HistoryKind::Message;
  try {
    kind = vts::parseHistoryKind(a.positional[2]);
  } catch (const vts::StoreError&) {
    throw UsageError("unknown history type '" + a.positional[2] + "'");
  }
  store.open(a.positional[1]);
  const std::string& text = a.positional[3];
  switch (kind) {
    case vts::HistoryKind::Message: store.logMessage(text); break;
    case vts::HistoryKind::Warning: store.logWarning(text); break;
    case vts::HistoryKind::Error:   store.logError(text); break;
    case vts::HistoryKind::Version: store.logVersion(text); break;
  }
  store.close();
  return 0;
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const Args args = parse_args(argc, argv);
    if (args.positional.empty() || args.positional[0] == "help") {
      print_usage(argv[0]);
      return args.positional.empty() ? 1 : 0;
    }

    vts::StoreConfig cfg = vts::loadConfig(args.configPath);
    if (args.verbosity) cfg.verbosity = *args.verbosity;
    if (args.gate) cfg.gate = *args.gate;
    if (cfg.verbosity >= 2) {
      spdlog::set_level(spdlog::level::debug);
      spdlog::debug("settings: verbosity={} journal_mode={} busy_timeout_ms={} gate={}",
                    cfg.verbosity, cfg.journal_mode, cfg.busy_timeout_ms,
                    vts::to_string(cfg.gate));
    }

    vts::Store store(cfg.verbosity, gate_for(cfg.gate), cfg.connectionOptions());

    const std::string& cmd = args.positional[0];
    if (cmd == "create")     return cmd_create(store, args);
    if (cmd == "info")       return cmd_info(store, args);
    if (cmd == "history")    return cmd_history(store, args);
    if (cmd == "add-table")  return cmd_add_table(store, args);
    if (cmd == "drop-table") return cmd_drop_table(store, args);
    if (cmd == "log")        return cmd_log(store, args);

    spdlog::error("unknown command '{}'", cmd);
    print_usage(argv[0]);
    return 1;
  } catch (const UsageError& e) {
    spdlog::error("{}", e.what());
    return 1;
  } catch (const vts::StoreError& e) {
    spdlog::error("{}: {}", vts::to_string(e.code()), e.what());
    return 2;
  } catch (const std::exception& e) {
    spdlog::error("Fatal: {}", e.what());
    return 2;
  }
}
