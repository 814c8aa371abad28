#include <blake3.h>
#include <ferry/blake3/hash.hpp>

namespace ferry::blake3 {

struct hasher::state final {
  blake3_hasher native{};
};

hasher::hasher() : state_{std::make_unique<state>()} {
  blake3_hasher_init(&state_->native);
}

hasher::~hasher() = default;
hasher::hasher(hasher&&) noexcept = default;
hasher& hasher::operator=(hasher&&) noexcept = default;

hasher& hasher::update(const std::string_view& str) {
  blake3_hasher_update(&state_->native, str.data(), str.size());
  return *this;
}

hasher& hasher::update(const std::span<const uint8_t>& bytes) {
  blake3_hasher_update(&state_->native, bytes.data(), bytes.size());
  return *this;
}

ferry::schema::hash32_t hasher::finalize() const {
  auto output = ferry::schema::hash32_t{};
  blake3_hasher_finalize(&state_->native, output.data(), output.size());
  return output;
}

ferry::schema::hash32_t hash(const std::string_view& str) {
  return hasher{}.update(str).finalize();
}

ferry::schema::hash32_t hash(const std::span<const uint8_t>& bytes) {
  return hasher{}.update(bytes).finalize();
}

}  // namespace ferry::blake3
