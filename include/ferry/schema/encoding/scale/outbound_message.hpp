#pragma once
#include <ferry/schema/outbound_message.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const outbound_message<1>& o, ::scale::Encoder& encoder);
void decode(outbound_message<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
