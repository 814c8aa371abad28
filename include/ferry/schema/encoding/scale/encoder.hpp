#pragma once
#include <ferry/common/critical.hpp>
#include <ferry/schema/encoding/encoder.hpp>
#include <ferry/schema/encoding/scale/endpoint_records.hpp>
#include <ferry/schema/encoding/scale/escrow_state.hpp>
#include <ferry/schema/encoding/scale/hub_intent_state.hpp>
#include <ferry/schema/encoding/scale/outbound_message.hpp>
#include <ferry/schema/encoding/scale/requirements_state.hpp>

#include <iterator>
#include <scale/scale.hpp>

namespace ferry::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  ferry::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, ferry::schema::bytes_t& out);

  template <typename T>
  T decode(const ferry::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const ferry::schema::bytes_view_t& bytes);
};

template <typename T>
ferry::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    ferry::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        ferry::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const ferry::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    ferry::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const ferry::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace ferry::schema::encoding

namespace ferry {

using encoder_t =
    ferry::schema::encoding::encoder<ferry::schema::encoding::scale_encoder_tag>;

}  // namespace ferry
