#pragma once
#include <ferry/schema/encoding/scale/encoder.hpp>
#include <ferry/schema/primitives.hpp>
#include <ferry/storage/rocksdb/storage.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace ferry::execution {

/// Buffers every write of one operation over committed storage. Reads see
/// the buffered writes first. Nothing reaches storage until commit(), which
/// lands the whole set in one RocksDB batch.
class write_set final {
 public:
  write_set(encoder_t& encoder, const storage::rocksdb_storage_t& storage);

  template <typename T>
  std::optional<T> get(const schema::bytes_t& key) const;

  template <typename T>
  void put(const schema::bytes_t& key, const T& value);

  bool contains(const schema::bytes_t& key) const;

  std::vector<storage::key_value_entry_t> list_from(
      const schema::bytes_t& prefix,
      const schema::bytes_t& from,
      std::size_t limit) const;

  std::size_t pending() const { return pending_.size(); }
  void commit();
  void discard() { pending_.clear(); }

  encoder_t& encoder() { return encoder_; }

 private:
  encoder_t& encoder_;
  const storage::rocksdb_storage_t& storage_;
  std::map<schema::bytes_t, schema::bytes_t> pending_;
};

template <typename T>
std::optional<T> write_set::get(const schema::bytes_t& key) const {
  if (auto it = pending_.find(key); it != std::end(pending_)) {
    return encoder_.decode<T>(schema::make_bytes_view(it->second));
  }
  return storage_.get<T>(encoder_, schema::make_bytes_view(key));
}

template <typename T>
void write_set::put(const schema::bytes_t& key, const T& value) {
  pending_[key] = encoder_.encode(value);
}

}  // namespace ferry::execution
