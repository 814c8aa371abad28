#pragma once
#include <ferry/schema/primitives.hpp>

#include <cstdint>

namespace ferry::schema {

template <uint16_t Version>
struct intent_requirements;

// Hub -> connected chain. What the requester expects the counterpart on the
// connected chain to escrow (inflow) or pay out (outflow).
template <>
struct intent_requirements<1> final {
  intent_id_t intent_id{};
  address_t requester_addr{};
  amount_t amount_required{};
  address_t token_addr{};
  // Zero means any solver may fulfill.
  address_t solver_addr{};
  timestamp_seconds_t expiry{};

  bool operator==(const intent_requirements&) const = default;
};

using intent_requirements_t = intent_requirements<1>;

}  // namespace ferry::schema
