#pragma once
#include <ferry/schema/requirements_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const intent_requirements<1>& o, ::scale::Encoder& encoder);
void decode(intent_requirements<1>& o, ::scale::Decoder& decoder);

void encode(const requirements_state<1>& o, ::scale::Encoder& encoder);
void decode(requirements_state<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
