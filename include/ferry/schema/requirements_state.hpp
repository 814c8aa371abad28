#pragma once
#include <ferry/schema/intent_requirements.hpp>
#include <ferry/schema/primitives.hpp>

#include <cstdint>

namespace ferry::schema {

template <uint16_t Version>
struct requirements_state;

// Intent requirements as stored on the connected chain, together with the
// flags the consuming module flips.
template <>
struct requirements_state<1> final {
  intent_requirements_t requirements{};
  chain_id_t src_chain_id{};
  address_t src_addr{};
  timestamp_seconds_t received_at{};
  bool escrow_created{};
  bool fulfilled{};

  bool operator==(const requirements_state&) const = default;
};

using requirements_state_t = requirements_state<1>;

}  // namespace ferry::schema
