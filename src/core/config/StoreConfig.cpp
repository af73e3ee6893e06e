#include "StoreConfig.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

using nlohmann::json;

namespace vts {

namespace {

std::optional<std::string> get_env(const char* key) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return std::nullopt;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return std::nullopt;
#endif
}

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

std::string checkJournalMode(const std::string& raw, const std::string& key) {
  const std::string mode = upper(raw);
  static const char* kModes[] = {"DELETE", "TRUNCATE", "PERSIST", "MEMORY", "WAL", "OFF"};
  for (const char* m : kModes) {
    if (mode == m) return mode;
  }
  throw std::runtime_error(key + ": unsupported journal mode '" + raw + "'");
}

int checkNonNegative(int v, const std::string& key) {
  if (v < 0) throw std::runtime_error(key + ": must not be negative");
  return v;
}

int parseInt(const std::string& raw, const std::string& key) {
  try {
    size_t used = 0;
    int v = std::stoi(raw, &used);
    if (used != raw.size()) throw std::invalid_argument(raw);
    return v;
  } catch (const std::logic_error&) {
    throw std::runtime_error(key + ": expected an integer, got '" + raw + "'");
  }
}

} // namespace

GatePolicy parseGatePolicy(const std::string& text) {
  const std::string p = upper(text);
  if (p == "PROMPT") return GatePolicy::Prompt;
  if (p == "ALLOW" || p == "YES") return GatePolicy::Allow;
  if (p == "DENY" || p == "NO") return GatePolicy::Deny;
  throw std::runtime_error("unknown gate policy '" + text + "' (expected prompt, allow or deny)");
}

const char* to_string(GatePolicy policy) {
  switch (policy) {
    case GatePolicy::Prompt: return "prompt";
    case GatePolicy::Allow:  return "allow";
    case GatePolicy::Deny:   return "deny";
  }
  return "prompt";
}

ConnectionOptions StoreConfig::connectionOptions() const {
  ConnectionOptions opts;
  opts.journal_mode = journal_mode;
  opts.busy_timeout_ms = busy_timeout_ms;
  return opts;
}

void applyJsonText(StoreConfig& cfg, const std::string& text, const std::string& source) {
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error& e) {
    throw std::runtime_error("invalid JSON in " + source + ": " + e.what());
  }
  if (!j.is_object()) throw std::runtime_error(source + ": expected a JSON object");

  try {
    if (j.contains("verbosity"))
      cfg.verbosity = j["verbosity"].get<int>();
    if (j.contains("journal_mode"))
      cfg.journal_mode = checkJournalMode(j["journal_mode"].get<std::string>(), "journal_mode");
    if (j.contains("busy_timeout_ms"))
      cfg.busy_timeout_ms = checkNonNegative(j["busy_timeout_ms"].get<int>(), "busy_timeout_ms");
    if (j.contains("gate"))
      cfg.gate = parseGatePolicy(j["gate"].get<std::string>());
  } catch (const json::type_error& e) {
    throw std::runtime_error(source + ": " + e.what());
  }
}

void applyJsonFile(StoreConfig& cfg, const std::string& path) {
  std::ifstream in(path);
  if (!in) throw std::runtime_error("Cannot open config file: " + path);
  std::ostringstream buf; buf << in.rdbuf();
  applyJsonText(cfg, buf.str(), path);
}

void applyEnvironment(StoreConfig& cfg) {
  if (auto v = get_env("VTS_VERBOSITY"))
    cfg.verbosity = parseInt(*v, "VTS_VERBOSITY");
  if (auto v = get_env("VTS_JOURNAL_MODE"))
    cfg.journal_mode = checkJournalMode(*v, "VTS_JOURNAL_MODE");
  if (auto v = get_env("VTS_BUSY_TIMEOUT_MS"))
    cfg.busy_timeout_ms = checkNonNegative(parseInt(*v, "VTS_BUSY_TIMEOUT_MS"), "VTS_BUSY_TIMEOUT_MS");
  if (auto v = get_env("VTS_GATE"))
    cfg.gate = parseGatePolicy(*v);
}

StoreConfig loadConfig(const std::optional<std::string>& configPath) {
  StoreConfig cfg;
  std::optional<std::string> path = configPath ? configPath : get_env("VTS_CONFIG");
  if (path && !path->empty()) applyJsonFile(cfg, *path);
  applyEnvironment(cfg);
  return cfg;
}

} // namespace vts
