#pragma once
#include "config.hpp"
#include "quantizer.hpp"
#include <atomic>
#include <filesystem>
#include <string>
#include <system_error>
#include <unistd.h>

// Unique sqlite file under the temp dir. Removed, together with its WAL side files
// and HNSW index, on scope exit.
class TempDb {
public:
  TempDb() {
    static std::atomic<int> counter{0};
    auto dir = std::filesystem::temp_directory_path();
    path_ = (dir / ("mvstore_test_" + std::to_string(::getpid()) + "_" +
                    std::to_string(counter++) + ".db")).string();
    cleanup();
  }
  ~TempDb() { cleanup(); }

  TempDb(const TempDb&) = delete;
  TempDb& operator=(const TempDb&) = delete;

  const std::string& path() const { return path_; }

  StoreConfig config(size_t bit_dimension = 8) const {
    StoreConfig c;
    c.uri = path_;
    c.bit_dimension = bit_dimension;
    c.max_retries = 2;
    c.retry_delay_ms = 0;
    c.busy_timeout_ms = 1000;
    c.log_level = "off";
    return c;
  }

private:
  void cleanup() {
    std::error_code ec;
    for (const char* suffix : {"", "-wal", "-shm", "-journal", ".hnsw"}) {
      std::filesystem::remove(path_ + suffix, ec);
    }
  }

  std::string path_;
};

// "1100" -> {1, 1, -1, -1}
inline std::vector<float> vec_from_bits(const std::string& bits) {
  std::vector<float> v;
  v.reserve(bits.size());
  for (char c : bits) v.push_back(c == '1' ? 1.0f : -1.0f);
  return v;
}

inline BitVector bits(const std::string& pattern) {
  BitVector bv(pattern.size());
  for (size_t i = 0; i < pattern.size(); ++i) {
    if (pattern[i] == '1') bv.set(i);
  }
  return bv;
}

// A path sqlite can never open.
inline std::string unreachable_db_path() {
  return (std::filesystem::temp_directory_path() / "mvstore_no_such_dir" / "sub" / "x.db").string();
}
