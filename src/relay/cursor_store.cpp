#include <ferry/relay/cursor_store.hpp>
#include <ferry/schema/key/ledger_keys.hpp>

namespace ferry::relay {

cursor_store::cursor_store(const storage::rocksdb_storage_t& storage)
    : storage_{storage} {}

schema::nonce_t cursor_store::load(const schema::chain_id_t src_chain_id,
                                   const schema::chain_id_t dst_chain_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto key = schema::key::make_relay_cursor_key(src_chain_id, dst_chain_id);
  return storage_.get<schema::nonce_t>(encoder_, schema::make_bytes_view(key))
      .value_or(0);
}

void cursor_store::save(const schema::chain_id_t src_chain_id,
                        const schema::chain_id_t dst_chain_id,
                        const schema::nonce_t cursor) {
  auto lock = std::scoped_lock{mutex_};
  auto key = schema::key::make_relay_cursor_key(src_chain_id, dst_chain_id);
  storage_.put(encoder_, schema::make_bytes_view(key), cursor);
}

}  // namespace ferry::relay
