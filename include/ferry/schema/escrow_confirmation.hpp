#pragma once
#include <ferry/schema/primitives.hpp>

#include <cstdint>

namespace ferry::schema {

template <uint16_t Version>
struct escrow_confirmation;

// Connected chain -> hub. Funds for the intent are locked.
template <>
struct escrow_confirmation<1> final {
  intent_id_t intent_id{};
  escrow_id_t escrow_id{};
  amount_t amount_escrowed{};
  address_t token_addr{};
  address_t creator_addr{};

  bool operator==(const escrow_confirmation&) const = default;
};

using escrow_confirmation_t = escrow_confirmation<1>;

}  // namespace ferry::schema
