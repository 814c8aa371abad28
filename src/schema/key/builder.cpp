#include <ferry/blake3/hash.hpp>
#include <ferry/schema/key/builder.hpp>

#include <algorithm>
#include <iterator>

namespace ferry::schema::key {

builder& builder::write(const std::string_view& str) {
  std::copy(std::begin(str), std::end(str), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::copy(std::begin(bytes), std::end(bytes), std::back_inserter(data));
  return *this;
}

ferry::schema::hash32_t builder::hash() const {
  return ferry::blake3::hash(ferry::schema::make_bytes_view(data));
}

}  // namespace ferry::schema::key
