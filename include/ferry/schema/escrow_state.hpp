#pragma once
#include <ferry/schema/escrow_status.hpp>
#include <ferry/schema/primitives.hpp>

#include <cstdint>

namespace ferry::schema {

template <uint16_t Version>
struct escrow_state;

template <>
struct escrow_state<1> final {
  intent_id_t intent_id{};
  escrow_id_t escrow_id{};
  address_t requester_addr{};
  address_t token_addr{};
  // Remaining custody. Drops to zero on release or cancel.
  amount_t amount{};
  amount_t deposited{};
  // Fixed at creation. Every release pays this account.
  address_t reserved_solver{};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t expiry{};
  escrow_status_t status{escrow_status_t::open};
  address_t released_to{};

  bool operator==(const escrow_state&) const = default;
};

using escrow_state_t = escrow_state<1>;

}  // namespace ferry::schema
