#pragma once
#include <ferry/schema/endpoint_records.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const remote_endpoints<1>& o, ::scale::Encoder& encoder);
void decode(remote_endpoints<1>& o, ::scale::Decoder& decoder);

void encode(const handler_binding<1>& o, ::scale::Encoder& encoder);
void decode(handler_binding<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
