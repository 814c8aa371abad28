#pragma once
#include <ferry/schema/primitives.hpp>

#include <cstdint>

namespace ferry::schema {

template <uint16_t Version>
struct outbound_message;

// Mailbox entry. Nonces are assigned by the sending endpoint, strictly
// increasing from 1 and never reused.
template <>
struct outbound_message<1> final {
  nonce_t nonce{};
  address_t src_addr{};
  chain_id_t dst_chain_id{};
  address_t dst_addr{};
  bytes_t payload;

  bool operator==(const outbound_message&) const = default;
};

using outbound_message_t = outbound_message<1>;

}  // namespace ferry::schema
