#pragma once

#include <ferry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ferry::schema {

// Leading tag byte of every GMP payload.
enum class message_type_t : uint8_t {
  intent_requirements = 0x01,
  escrow_confirmation = 0x02,
  fulfillment_proof = 0x03
};

inline constexpr auto kMessageTypeMappings = std::array{
    enum_mapping_t<message_type_t>{"intent_requirements",
                                   message_type_t::intent_requirements},
    enum_mapping_t<message_type_t>{"escrow_confirmation",
                                   message_type_t::escrow_confirmation},
    enum_mapping_t<message_type_t>{"fulfillment_proof",
                                   message_type_t::fulfillment_proof}};

template <>
inline std::optional<message_type_t> try_from_string<message_type_t>(
    const std::string_view value) {
  return from_string(value, kMessageTypeMappings);
}

inline constexpr std::string_view to_string(const message_type_t value) {
  return to_string(value, kMessageTypeMappings).value_or("unknown");
}

inline constexpr std::optional<message_type_t> try_make_message_type(
    const uint8_t tag) {
  switch (tag) {
    case static_cast<uint8_t>(message_type_t::intent_requirements):
      return message_type_t::intent_requirements;
    case static_cast<uint8_t>(message_type_t::escrow_confirmation):
      return message_type_t::escrow_confirmation;
    case static_cast<uint8_t>(message_type_t::fulfillment_proof):
      return message_type_t::fulfillment_proof;
    default:
      return std::nullopt;
  }
}

}  // namespace ferry::schema
