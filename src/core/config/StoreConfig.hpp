#pragma once
#include "core/engine/SqliteConnection.hpp"
#include <optional>
#include <string>

namespace vts {

enum class GatePolicy { Prompt, Allow, Deny };

GatePolicy parseGatePolicy(const std::string& text);
const char* to_string(GatePolicy policy);

struct StoreConfig {
  int         verbosity = 0;
  std::string journal_mode = "DELETE";
  int         busy_timeout_ms = 5000;
  GatePolicy  gate = GatePolicy::Prompt;

  ConnectionOptions connectionOptions() const;
};

// Overlays keys found in a JSON object:
//   { "verbosity": 1, "journal_mode": "WAL", "busy_timeout_ms": 2000, "gate": "deny" }
// Unknown keys are ignored; bad values throw std::runtime_error naming the key.
void applyJsonText(StoreConfig& cfg, const std::string& text, const std::string& source);
void applyJsonFile(StoreConfig& cfg, const std::string& path);

// VTS_VERBOSITY, VTS_JOURNAL_MODE, VTS_BUSY_TIMEOUT_MS, VTS_GATE
void applyEnvironment(StoreConfig& cfg);

// defaults -> JSON file (configPath, else VTS_CONFIG if set) -> environment
StoreConfig loadConfig(const std::optional<std::string>& configPath = std::nullopt);

} // namespace vts
