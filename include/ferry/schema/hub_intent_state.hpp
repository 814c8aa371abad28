#pragma once
#include <ferry/schema/hub_intent_status.hpp>
#include <ferry/schema/primitives.hpp>

#include <cstdint>

namespace ferry::schema {

template <uint16_t Version>
struct hub_intent_state;

template <>
struct hub_intent_state<1> final {
  intent_id_t intent_id{};
  intent_flow_t flow{intent_flow_t::inflow};
  hub_intent_status_t status{hub_intent_status_t::requirements_sent};
  address_t requester_addr{};
  // Zero means any solver.
  address_t solver_addr{};
  chain_id_t connected_chain_id{};
  // Escrow module (inflow) or outflow validator (outflow) on the connected
  // chain.
  address_t connected_handler_addr{};
  address_t connected_token_addr{};
  amount_t connected_amount{};
  address_t hub_token_addr{};
  amount_t hub_amount{};
  timestamp_seconds_t created_at{};
  timestamp_seconds_t expiry{};
  escrow_id_t escrow_id{};
  address_t fulfilled_by{};

  bool operator==(const hub_intent_state&) const = default;
};

using hub_intent_state_t = hub_intent_state<1>;

}  // namespace ferry::schema
