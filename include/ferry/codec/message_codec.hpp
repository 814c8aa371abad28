#pragma once
#include <ferry/schema/error_code.hpp>
#include <ferry/schema/message.hpp>
#include <ferry/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <utility>

// Fixed-layout, big-endian GMP wire format. Every payload starts with the
// 1-byte type tag followed by the 32-byte intent id.
namespace ferry::codec {

inline constexpr auto kPrefixSize = std::size_t{33};
inline constexpr auto kIntentRequirementsSize = std::size_t{145};
inline constexpr auto kEscrowConfirmationSize = std::size_t{137};
inline constexpr auto kFulfillmentProofSize = std::size_t{81};

constexpr std::size_t encoded_size(const ferry::schema::message_type_t type) {
  switch (type) {
    case ferry::schema::message_type_t::intent_requirements:
      return kIntentRequirementsSize;
    case ferry::schema::message_type_t::escrow_confirmation:
      return kEscrowConfirmationSize;
    case ferry::schema::message_type_t::fulfillment_proof:
      return kFulfillmentProofSize;
  }
  return 0;
}

ferry::schema::bytes_t encode(const ferry::schema::message_t& message);

/// Decodes a full payload. On failure returns nullopt and sets `error` to
/// empty_payload, unknown_message_type or invalid_length.
std::optional<ferry::schema::message_t> try_decode(
    const ferry::schema::bytes_view_t& payload,
    ferry::schema::error_code_t& error);

/// Reads only the tag byte.
std::optional<ferry::schema::message_type_t> peek_type(
    const ferry::schema::bytes_view_t& payload,
    ferry::schema::error_code_t& error);

/// Reads the shared tag + intent id prefix without decoding the body.
/// Fails with invalid_payload when the prefix is short or the tag unknown.
std::optional<std::pair<ferry::schema::message_type_t,
                        ferry::schema::intent_id_t>>
peek_prefix(const ferry::schema::bytes_view_t& payload,
            ferry::schema::error_code_t& error);

}  // namespace ferry::codec
