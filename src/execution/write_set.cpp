#include <ferry/execution/write_set.hpp>

#include <algorithm>
#include <iterator>

namespace ferry::execution {

write_set::write_set(encoder_t& encoder,
                     const storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

bool write_set::contains(const schema::bytes_t& key) const {
  if (pending_.contains(key)) {
    return true;
  }
  return storage_.get_raw(schema::make_bytes_view(key)).has_value();
}

std::vector<storage::key_value_entry_t> write_set::list_from(
    const schema::bytes_t& prefix,
    const schema::bytes_t& from,
    const std::size_t limit) const {
  auto merged = std::map<schema::bytes_t, schema::bytes_t>{};
  for (auto& [key, value] : storage_.list_from(schema::make_bytes_view(prefix),
                                               schema::make_bytes_view(from),
                                               limit)) {
    merged.emplace(std::move(key), std::move(value));
  }
  auto has_prefix = [&prefix](const schema::bytes_t& key) {
    return key.size() >= prefix.size() &&
           std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
  };
  for (auto it = pending_.lower_bound(from);
       it != std::end(pending_) && has_prefix(it->first); ++it) {
    merged[it->first] = it->second;
  }

  auto entries = std::vector<storage::key_value_entry_t>{};
  for (auto& entry : merged) {
    if (entries.size() == limit) {
      break;
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

void write_set::commit() {
  auto writes = std::vector<storage::key_value_entry_t>{};
  writes.reserve(pending_.size());
  for (auto& entry : pending_) {
    writes.push_back(entry);
  }
  storage_.commit(writes);
  pending_.clear();
}

}  // namespace ferry::execution
