#pragma once
#include <ferry/schema/hub_intent_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace ferry::schema {

void encode(const intent_flow_t& o, ::scale::Encoder& encoder);
void decode(intent_flow_t& o, ::scale::Decoder& decoder);

void encode(const hub_intent_status_t& o, ::scale::Encoder& encoder);
void decode(hub_intent_status_t& o, ::scale::Decoder& decoder);

void encode(const hub_intent_state<1>& o, ::scale::Encoder& encoder);
void decode(hub_intent_state<1>& o, ::scale::Decoder& decoder);

}  // namespace ferry::schema
