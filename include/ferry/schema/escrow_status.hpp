#pragma once

#include <ferry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ferry::schema {

// open -> released | cancelled. Both exits are terminal.
enum class escrow_status_t : uint8_t { open = 0, released = 1, cancelled = 2 };

inline constexpr auto kEscrowStatusMappings = std::array{
    enum_mapping_t<escrow_status_t>{"open", escrow_status_t::open},
    enum_mapping_t<escrow_status_t>{"released", escrow_status_t::released},
    enum_mapping_t<escrow_status_t>{"cancelled", escrow_status_t::cancelled}};

template <>
inline std::optional<escrow_status_t> try_from_string<escrow_status_t>(
    const std::string_view value) {
  return from_string(value, kEscrowStatusMappings);
}

inline constexpr std::string_view to_string(const escrow_status_t value) {
  return to_string(value, kEscrowStatusMappings).value_or("unknown");
}

}  // namespace ferry::schema
