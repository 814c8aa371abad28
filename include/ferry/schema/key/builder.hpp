#pragma once
#include <ferry/schema/primitives.hpp>

#include <boost/endian/conversion.hpp>

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace ferry::schema::key {

// Byte-oriented key writer. Integers are written big-endian so that keys
// sharing a prefix iterate in numeric order.
struct builder final {
  ferry::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  /// BLAKE3 digest of the bytes written so far.
  ferry::schema::hash32_t hash() const;

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto buffer = std::array<uint8_t, sizeof(T)>{};
    boost::endian::endian_store<T, sizeof(T), boost::endian::order::big>(
        buffer.data(), value);
    return write(std::span<const uint8_t>{buffer.data(), buffer.size()});
  }
};

}  // namespace ferry::schema::key
