#include <ferry/schema/encoding/scale/outbound_message.hpp>

namespace ferry::schema {

void encode(const outbound_message<1>& o, ::scale::Encoder& encoder) {
  encode(o.nonce, encoder);
  encode(o.src_addr, encoder);
  encode(o.dst_chain_id, encoder);
  encode(o.dst_addr, encoder);
  encode(o.payload, encoder);
}

void decode(outbound_message<1>& o, ::scale::Decoder& decoder) {
  decode(o.nonce, decoder);
  decode(o.src_addr, decoder);
  decode(o.dst_chain_id, decoder);
  decode(o.dst_addr, decoder);
  decode(o.payload, decoder);
}

}  // namespace ferry::schema
