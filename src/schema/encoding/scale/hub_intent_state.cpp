#include <ferry/common/critical.hpp>
#include <ferry/schema/encoding/scale/hub_intent_state.hpp>

namespace ferry::schema {

void encode(const intent_flow_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(intent_flow_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(intent_flow_t::outflow)) {
    ferry::common::critical("corrupt intent flow in storage");
  }
  o = static_cast<intent_flow_t>(raw);
}

void encode(const hub_intent_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(hub_intent_status_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(hub_intent_status_t::cancelled)) {
    ferry::common::critical("corrupt hub intent status in storage");
  }
  o = static_cast<hub_intent_status_t>(raw);
}

void encode(const hub_intent_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.intent_id, encoder);
  encode(o.flow, encoder);
  encode(o.status, encoder);
  encode(o.requester_addr, encoder);
  encode(o.solver_addr, encoder);
  encode(o.connected_chain_id, encoder);
  encode(o.connected_handler_addr, encoder);
  encode(o.connected_token_addr, encoder);
  encode(o.connected_amount, encoder);
  encode(o.hub_token_addr, encoder);
  encode(o.hub_amount, encoder);
  encode(o.created_at, encoder);
  encode(o.expiry, encoder);
  encode(o.escrow_id, encoder);
  encode(o.fulfilled_by, encoder);
}

void decode(hub_intent_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.intent_id, decoder);
  decode(o.flow, decoder);
  decode(o.status, decoder);
  decode(o.requester_addr, decoder);
  decode(o.solver_addr, decoder);
  decode(o.connected_chain_id, decoder);
  decode(o.connected_handler_addr, decoder);
  decode(o.connected_token_addr, decoder);
  decode(o.connected_amount, decoder);
  decode(o.hub_token_addr, decoder);
  decode(o.hub_amount, decoder);
  decode(o.created_at, decoder);
  decode(o.expiry, decoder);
  decode(o.escrow_id, decoder);
  decode(o.fulfilled_by, decoder);
}

}  // namespace ferry::schema
