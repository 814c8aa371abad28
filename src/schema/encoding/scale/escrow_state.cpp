#include <ferry/common/critical.hpp>
#include <ferry/schema/encoding/scale/escrow_state.hpp>

namespace ferry::schema {

void encode(const escrow_status_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(escrow_status_t& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(escrow_status_t::cancelled)) {
    ferry::common::critical("corrupt escrow status in storage");
  }
  o = static_cast<escrow_status_t>(raw);
}

void encode(const escrow_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.intent_id, encoder);
  encode(o.escrow_id, encoder);
  encode(o.requester_addr, encoder);
  encode(o.token_addr, encoder);
  encode(o.amount, encoder);
  encode(o.deposited, encoder);
  encode(o.reserved_solver, encoder);
  encode(o.created_at, encoder);
  encode(o.expiry, encoder);
  encode(o.status, encoder);
  encode(o.released_to, encoder);
}

void decode(escrow_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.intent_id, decoder);
  decode(o.escrow_id, decoder);
  decode(o.requester_addr, decoder);
  decode(o.token_addr, decoder);
  decode(o.amount, decoder);
  decode(o.deposited, decoder);
  decode(o.reserved_solver, decoder);
  decode(o.created_at, decoder);
  decode(o.expiry, decoder);
  decode(o.status, decoder);
  decode(o.released_to, decoder);
}

}  // namespace ferry::schema
