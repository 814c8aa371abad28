#pragma once
#include <ferry/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace ferry::storage {

using key_value_entry_t =
    std::pair<ferry::schema::bytes_t, ferry::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const ferry::schema::bytes_view_t& key) const;

  /// Encode and persist a single value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const ferry::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<ferry::schema::bytes_t> get_raw(
      const ferry::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const ferry::schema::bytes_view_t& prefix) const;

  /// Return up to `limit` entries under prefix, starting at `from` inclusive,
  /// in key order.
  std::vector<key_value_entry_t> list_from(
      const ferry::schema::bytes_view_t& prefix,
      const ferry::schema::bytes_view_t& from,
      std::size_t limit) const;

  /// Atomically apply every write, or none of them.
  void commit(const std::vector<key_value_entry_t>& writes) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace ferry::storage
