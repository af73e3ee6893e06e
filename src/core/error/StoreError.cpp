#include "StoreError.hpp"

namespace vts {

const char* to_string(StoreErrc code) {
  switch (code) {
    case StoreErrc::AlreadyOpen:       return "AlreadyOpen";
    case StoreErrc::NotOpen:           return "NotOpen";
    case StoreErrc::NotFound:          return "NotFound";
    case StoreErrc::EngineError:       return "EngineError";
    case StoreErrc::NoVersionRecorded: return "NoVersionRecorded";
    case StoreErrc::InvalidName:       return "InvalidName";
  }
  return "Unknown";
}

StoreError::StoreError(StoreErrc code, const std::string& what)
  : std::runtime_error(what), code_(code) {}

} // namespace vts
