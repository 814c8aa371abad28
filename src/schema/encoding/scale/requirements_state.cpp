#include <ferry/schema/encoding/scale/requirements_state.hpp>

namespace ferry::schema {

void encode(const intent_requirements<1>& o, ::scale::Encoder& encoder) {
  encode(o.intent_id, encoder);
  encode(o.requester_addr, encoder);
  encode(o.amount_required, encoder);
  encode(o.token_addr, encoder);
  encode(o.solver_addr, encoder);
  encode(o.expiry, encoder);
}

void decode(intent_requirements<1>& o, ::scale::Decoder& decoder) {
  decode(o.intent_id, decoder);
  decode(o.requester_addr, decoder);
  decode(o.amount_required, decoder);
  decode(o.token_addr, decoder);
  decode(o.solver_addr, decoder);
  decode(o.expiry, decoder);
}

void encode(const requirements_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.requirements, encoder);
  encode(o.src_chain_id, encoder);
  encode(o.src_addr, encoder);
  encode(o.received_at, encoder);
  encode(o.escrow_created, encoder);
  encode(o.fulfilled, encoder);
}

void decode(requirements_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.requirements, decoder);
  decode(o.src_chain_id, decoder);
  decode(o.src_addr, decoder);
  decode(o.received_at, decoder);
  decode(o.escrow_created, decoder);
  decode(o.fulfilled, decoder);
}

}  // namespace ferry::schema
