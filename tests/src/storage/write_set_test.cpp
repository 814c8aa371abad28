#include <ferry/execution/write_set.hpp>
#include <ferry/relay/cursor_store.hpp>
#include <ferry/schema/key/ledger_keys.hpp>
#include <ferry/schema/outbound_message.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <ferry/testing/common.hpp>
#include <gtest/gtest.h>

namespace {

namespace key = ferry::schema::key;

class write_set_test : public ::testing::Test {
 protected:
  write_set_test()
      : path_{"ferry_write_set"},
        storage_{ferry::storage::make_storage<
            ferry::storage::rocksdb_storage_tag>(path_.path())} {}

  ferry::schema::outbound_message_t make_entry(const ferry::schema::nonce_t nonce) {
    return ferry::schema::outbound_message_t{
        .nonce = nonce,
        .src_addr = ferry::testing::make_hash(0x10),
        .dst_chain_id = 30,
        .dst_addr = ferry::testing::make_hash(0x20),
        .payload = ferry::schema::bytes_t{0x01, static_cast<uint8_t>(nonce)}};
  }

  ferry::testing::scoped_path path_;
  ferry::storage::rocksdb_storage_t storage_;
  ferry::encoder_t encoder_;
};

}  // namespace

TEST_F(write_set_test, reads_see_pending_writes_before_commit) {
  auto state = ferry::execution::write_set{encoder_, storage_};
  auto nonce_key = key::make_prefix(key::kNextNonceKey);

  state.put(nonce_key, ferry::schema::nonce_t{7});

  EXPECT_EQ(state.get<ferry::schema::nonce_t>(nonce_key), 7u);
  EXPECT_TRUE(state.contains(nonce_key));
  EXPECT_FALSE(storage_.get_raw(ferry::schema::make_bytes_view(nonce_key))
                   .has_value());
}

TEST_F(write_set_test, commit_lands_every_write) {
  auto state = ferry::execution::write_set{encoder_, storage_};
  state.put(key::make_outbox_key(1), make_entry(1));
  state.put(key::make_outbox_key(2), make_entry(2));
  state.commit();

  EXPECT_EQ(state.pending(), 0u);
  auto fresh = ferry::execution::write_set{encoder_, storage_};
  EXPECT_EQ(fresh.get<ferry::schema::outbound_message_t>(key::make_outbox_key(2)),
            make_entry(2));
}

TEST_F(write_set_test, discard_drops_pending_writes) {
  auto state = ferry::execution::write_set{encoder_, storage_};
  state.put(key::make_outbox_key(1), make_entry(1));
  state.discard();
  state.commit();

  auto fresh = ferry::execution::write_set{encoder_, storage_};
  EXPECT_FALSE(fresh.contains(key::make_outbox_key(1)));
}

TEST_F(write_set_test, list_from_merges_storage_and_pending_in_key_order) {
  auto committed = ferry::execution::write_set{encoder_, storage_};
  committed.put(key::make_outbox_key(1), make_entry(1));
  committed.put(key::make_outbox_key(3), make_entry(3));
  committed.put(key::make_outbox_key(300), make_entry(300));
  committed.commit();

  auto state = ferry::execution::write_set{encoder_, storage_};
  state.put(key::make_outbox_key(2), make_entry(2));
  state.put(key::make_relay_cursor_key(1, 30), ferry::schema::nonce_t{5});

  auto entries = state.list_from(key::make_prefix(key::kOutboxPrefix),
                                 key::make_outbox_key(2), 10);

  ASSERT_EQ(entries.size(), 3u);
  auto nonces = std::vector<ferry::schema::nonce_t>{};
  for (const auto& [k, v] : entries) {
    nonces.push_back(encoder_
                         .decode<ferry::schema::outbound_message_t>(
                             ferry::schema::make_bytes_view(v))
                         .nonce);
  }
  EXPECT_EQ(nonces, (std::vector<ferry::schema::nonce_t>{2, 3, 300}));

  auto limited = state.list_from(key::make_prefix(key::kOutboxPrefix),
                                 key::make_outbox_key(1), 2);
  EXPECT_EQ(limited.size(), 2u);
}

TEST_F(write_set_test, delivery_ids_separate_message_types) {
  auto intent = ferry::testing::make_hash(0x01);
  EXPECT_NE(key::make_delivery_id(
                intent, ferry::schema::message_type_t::intent_requirements),
            key::make_delivery_id(
                intent, ferry::schema::message_type_t::fulfillment_proof));
  EXPECT_NE(key::make_escrow_id(1, intent), key::make_escrow_id(2, intent));
  EXPECT_EQ(key::make_escrow_id(1, intent), key::make_escrow_id(1, intent));
}

TEST_F(write_set_test, cursor_store_defaults_to_zero_and_persists) {
  auto cursors = ferry::relay::cursor_store{storage_};
  EXPECT_EQ(cursors.load(1, 30), 0u);

  cursors.save(1, 30, 12);
  EXPECT_EQ(cursors.load(1, 30), 12u);
  EXPECT_EQ(cursors.load(30, 1), 0u);

  auto reopened = ferry::relay::cursor_store{storage_};
  EXPECT_EQ(reopened.load(1, 30), 12u);
}
