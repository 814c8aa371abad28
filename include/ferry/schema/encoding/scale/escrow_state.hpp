#pragma once
#include <ferry/schema/escrow_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const escrow_status_t& o, ::scale::Encoder& encoder);
void decode(escrow_status_t& o, ::scale::Decoder& decoder);

void encode(const escrow_state<1>& o, ::scale::Encoder& encoder);
void decode(escrow_state<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
