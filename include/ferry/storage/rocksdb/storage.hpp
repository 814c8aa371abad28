#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <ferry/common/critical.hpp>
#include <ferry/storage/storage.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace ferry::storage {

namespace detail {

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const ferry::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline ferry::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline bool starts_with(const ROCKSDB_NAMESPACE::Slice& key,
                        const ferry::schema::bytes_view_t& prefix) {
  return key.starts_with(to_slice(prefix));
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const ferry::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const ferry::schema::bytes_view_t& key,
           const T& value) const;

  std::optional<ferry::schema::bytes_t> get_raw(
      const ferry::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const ferry::schema::bytes_view_t& prefix) const;
  std::vector<key_value_entry_t> list_from(
      const ferry::schema::bytes_view_t& prefix,
      const ferry::schema::bytes_view_t& from,
      std::size_t limit) const;
  void commit(const std::vector<key_value_entry_t>& writes) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const ferry::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(ferry::schema::make_bytes_view(*raw))};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const ferry::schema::bytes_view_t& key,
                                       const T& value) const {
  commit({key_value_entry_t{ferry::schema::make_bytes(key),
                            encoder.encode(value)}});
}

}  // namespace ferry::storage
