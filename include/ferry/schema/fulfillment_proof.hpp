#pragma once
#include <ferry/schema/primitives.hpp>

#include <cstdint>

namespace ferry::schema {

template <uint16_t Version>
struct fulfillment_proof;

// Either direction. The solver delivered on the other side of the intent.
template <>
struct fulfillment_proof<1> final {
  intent_id_t intent_id{};
  address_t solver_addr{};
  amount_t amount_fulfilled{};
  timestamp_seconds_t timestamp{};

  bool operator==(const fulfillment_proof&) const = default;
};

using fulfillment_proof_t = fulfillment_proof<1>;

}  // namespace ferry::schema
