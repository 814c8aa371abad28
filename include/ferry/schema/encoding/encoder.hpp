#pragma once
#include <ferry/schema/primitives.hpp>

#include <optional>

namespace ferry::schema::encoding {

// The serialization library is a build time choice. Call sites name
// `encoder<scale_encoder_tag>` and never touch the library directly.
template <typename Library>
struct encoder {
  template <typename T>
  ferry::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, ferry::schema::bytes_t& out);

  template <typename T>
  T decode(const ferry::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const ferry::schema::bytes_view_t& bytes);
};

}  // namespace ferry::schema::encoding
