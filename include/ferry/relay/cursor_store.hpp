#pragma once
#include <ferry/schema/encoding/scale/encoder.hpp>
#include <ferry/schema/primitives.hpp>
#include <ferry/storage/rocksdb/storage.hpp>

#include <mutex>

namespace ferry::relay {

/// Highest contiguously delivered nonce per (source, destination) pair.
class cursor_store final {
 public:
  explicit cursor_store(const storage::rocksdb_storage_t& storage);

  schema::nonce_t load(schema::chain_id_t src_chain_id,
                       schema::chain_id_t dst_chain_id) const;
  void save(schema::chain_id_t src_chain_id,
            schema::chain_id_t dst_chain_id,
            schema::nonce_t cursor);

 private:
  const storage::rocksdb_storage_t& storage_;
  mutable encoder_t encoder_;
  mutable std::mutex mutex_;
};

}  // namespace ferry::relay
