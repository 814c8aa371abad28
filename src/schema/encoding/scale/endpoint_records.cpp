#include <ferry/schema/encoding/scale/endpoint_records.hpp>

namespace ferry::schema {

void encode(const remote_endpoints<1>& o, ::scale::Encoder& encoder) {
  encode(o.addresses, encoder);
}

void decode(remote_endpoints<1>& o, ::scale::Decoder& decoder) {
  decode(o.addresses, decoder);
}

void encode(const handler_binding<1>& o, ::scale::Encoder& encoder) {
  encode(o.handlers, encoder);
}

void decode(handler_binding<1>& o, ::scale::Decoder& decoder) {
  decode(o.handlers, decoder);
}

}  // namespace ferry::schema
