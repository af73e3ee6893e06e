#pragma once
#include <stdexcept>
#include <string>

namespace vts {

enum class StoreErrc {
  AlreadyOpen,
  NotOpen,
  NotFound,
  EngineError,
  NoVersionRecorded,
  InvalidName
};

const char* to_string(StoreErrc code);

class StoreError : public std::runtime_error {
public:
  StoreError(StoreErrc code, const std::string& what);

  StoreErrc code() const noexcept { return code_; }

private:
  StoreErrc code_;
};

} // namespace vts
