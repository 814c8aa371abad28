#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace ferry::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Canonical 32-byte identity. Native addresses narrower than 32 bytes are
// left-padded with zeros.
using address_t = hash32_t;
using intent_id_t = hash32_t;
using escrow_id_t = hash32_t;
using chain_id_t = uint32_t;
using amount_t = uint64_t;
using nonce_t = uint64_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

inline constexpr auto kAddressSize = std::size_t{32};
inline constexpr auto kEvmAddressSize = std::size_t{20};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();
bool is_zero(const hash32_t& hash);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

/// Left-pads a chain-native address into the canonical 32-byte form.
/// Returns nullopt when the native address is wider than 32 bytes.
std::optional<address_t> try_make_address(const bytes_view_t& native);
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_address(const std::string_view& hex);

/// Recovers the low-order `width` bytes of a canonical address.
bytes_t native_address(const address_t& address, const std::size_t width);

struct ed25519_signer_id final {
  std::array<uint8_t, 32> public_key;
};

struct secp256k1_signer_id final {
  std::array<uint8_t, 33> public_key;
};

using signer_id_t = std::variant<ed25519_signer_id, secp256k1_signer_id>;

using ed25519_seed_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;
using secp256k1_signature_t = std::array<uint8_t, 65>;
using signature_t = std::variant<ed25519_signature_t, secp256k1_signature_t>;

}  // namespace ferry::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
