#pragma once
#include <ferry/schema/primitives.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

namespace ferry::blake3 {

ferry::schema::hash32_t hash(const std::string_view& str);
ferry::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Incremental hasher for digests over several fields.
class hasher final {
 public:
  hasher();
  ~hasher();
  hasher(hasher&&) noexcept;
  hasher& operator=(hasher&&) noexcept;

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);
  ferry::schema::hash32_t finalize() const;

 private:
  struct state;
  std::unique_ptr<state> state_;
};

}  // namespace ferry::blake3
