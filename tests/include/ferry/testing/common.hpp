#pragma once

#include <ferry/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <system_error>

namespace ferry::testing {

inline ferry::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = ferry::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = uint64_t{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(++counter));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes its directory on destruction. Declare before the storage using it.
class scoped_path final {
 public:
  explicit scoped_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}
  ~scoped_path() { remove_path(path_); }

  scoped_path(const scoped_path&) = delete;
  scoped_path& operator=(const scoped_path&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

class manual_clock final {
 public:
  explicit manual_clock(const ferry::schema::timestamp_seconds_t start = 1000)
      : now_{start} {}

  ferry::schema::timestamp_seconds_t now() const { return now_; }
  void set(const ferry::schema::timestamp_seconds_t now) { now_ = now; }
  void advance(const ferry::schema::duration_seconds_t seconds) {
    now_ += seconds;
  }

  std::function<ferry::schema::timestamp_seconds_t()> source() {
    return [this]() { return now_; };
  }

 private:
  ferry::schema::timestamp_seconds_t now_;
};

}  // namespace ferry::testing
