#pragma once
#include "core/error/StoreError.hpp"
#include "core/store/HistoryLog.hpp"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <system_error>

namespace vts::test {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
  TempDir()
  {
    static std::atomic<int> counter{0};
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("vts_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(path_);
  }

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  std::string file(const std::string& name) const { return (path_ / name).string(); }

private:
  std::filesystem::path path_;
};

// Clock whose reading the test controls.
struct ManualClock {
  std::shared_ptr<int64_t> now = std::make_shared<int64_t>(1000);

  Clock fn() const
  {
    auto n = now;
    return [n] { return *n; };
  }
  void set(int64_t t) { *now = t; }
};

// Code of the StoreError thrown by fn, or nullopt if it returned normally.
inline std::optional<StoreErrc> error_of(const std::function<void()>& fn)
{
  try {
    fn();
  } catch (const StoreError& e) {
    return e.code();
  }
  return std::nullopt;
}

inline void write_file(const std::string& path, const std::string& content)
{
  std::ofstream os(path, std::ios::binary);
  os << content;
}

inline std::string read_file(const std::string& path)
{
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace vts::test
