#include <ferry/relay/route_worker.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <ferry/testing/common.hpp>
#include <gtest/gtest.h>

#include <deque>
#include <vector>

namespace {

using namespace std::chrono_literals;
using ferry::schema::error_code_t;

constexpr auto kSource = ferry::schema::chain_id_t{1};
constexpr auto kDestination = ferry::schema::chain_id_t{30};

class fake_source final : public ferry::relay::chain_client {
 public:
  ferry::schema::chain_id_t chain_id() const override { return kSource; }

  std::optional<std::vector<ferry::schema::outbound_message_t>> list_outbound(
      const ferry::schema::nonce_t after,
      const std::size_t limit) override {
    ++calls;
    if (!reachable) {
      return std::nullopt;
    }
    auto out = std::vector<ferry::schema::outbound_message_t>{};
    for (const auto& message : mailbox) {
      if (message.nonce > after && out.size() < limit) {
        out.push_back(message);
      }
    }
    return out;
  }

  ferry::schema::operation_result_t deliver(ferry::schema::chain_id_t,
                                            const ferry::schema::address_t&,
                                            const ferry::schema::bytes_view_t&) override {
    return {};
  }

  void post(const ferry::schema::chain_id_t dst_chain_id = kDestination) {
    auto nonce = static_cast<ferry::schema::nonce_t>(mailbox.size() + 1);
    mailbox.push_back(ferry::schema::outbound_message_t{
        .nonce = nonce,
        .src_addr = ferry::testing::make_hash(0x10),
        .dst_chain_id = dst_chain_id,
        .dst_addr = ferry::testing::make_hash(0x20),
        .payload = ferry::schema::bytes_t{0x01, static_cast<uint8_t>(nonce)}});
  }

  std::vector<ferry::schema::outbound_message_t> mailbox;
  bool reachable{true};
  std::size_t calls{};
};

/// Answers deliveries from a script, ok once the script runs out.
class fake_destination final : public ferry::relay::chain_client {
 public:
  ferry::schema::chain_id_t chain_id() const override { return kDestination; }

  std::optional<std::vector<ferry::schema::outbound_message_t>> list_outbound(
      ferry::schema::nonce_t,
      std::size_t) override {
    return std::vector<ferry::schema::outbound_message_t>{};
  }

  ferry::schema::operation_result_t deliver(
      const ferry::schema::chain_id_t src_chain_id,
      const ferry::schema::address_t&,
      const ferry::schema::bytes_view_t& payload) override {
    EXPECT_EQ(src_chain_id, kSource);
    received.push_back(payload.size() > 1 ? payload[1] : 0);
    if (script.empty()) {
      return {};
    }
    auto code = script.front();
    script.pop_front();
    return ferry::schema::make_error_result(code, ferry::schema::kCodespaceNode,
                                            "scripted");
  }

  std::deque<error_code_t> script;
  std::vector<uint8_t> received;
};

class route_worker_test : public ::testing::Test {
 protected:
  route_worker_test()
      : path_{"ferry_route_worker"},
        storage_{ferry::storage::make_storage<
            ferry::storage::rocksdb_storage_tag>(path_.path())},
        cursors_{storage_} {}

  ferry::relay::route_worker make_worker(const std::size_t batch_size = 64) {
    return ferry::relay::route_worker{source_, destination_, cursors_,
                                      ferry::relay::backoff_policy{}, batch_size};
  }

  ferry::testing::scoped_path path_;
  ferry::storage::rocksdb_storage_t storage_;
  ferry::relay::cursor_store cursors_;
  fake_source source_;
  fake_destination destination_;
  ferry::relay::route_worker::time_point_t t0_{};
};

}  // namespace

TEST(backoff_policy, doubles_until_capped) {
  auto policy = ferry::relay::backoff_policy{.base = 500ms, .max = 1500ms};
  EXPECT_EQ(policy.delay(1), 500ms);
  EXPECT_EQ(policy.delay(2), 1000ms);
  EXPECT_EQ(policy.delay(3), 1500ms);
  EXPECT_EQ(policy.delay(64), 1500ms);
}

TEST_F(route_worker_test, delivers_in_order_and_persists_cursor) {
  source_.post();
  source_.post();
  source_.post();
  auto worker = make_worker();

  auto summary = worker.poll_once(t0_);

  EXPECT_EQ(summary.fetched, 3u);
  EXPECT_EQ(summary.delivered, 3u);
  EXPECT_EQ(summary.cursor, 3u);
  EXPECT_EQ(destination_.received, (std::vector<uint8_t>{1, 2, 3}));
  EXPECT_EQ(cursors_.load(kSource, kDestination), 3u);
  EXPECT_EQ(worker.pending(), 0u);
}

TEST_F(route_worker_test, failed_delivery_waits_for_backoff) {
  source_.post();
  source_.post();
  destination_.script = {error_code_t::unauthorized_relay};
  auto worker = make_worker();

  auto first = worker.poll_once(t0_);
  EXPECT_EQ(first.failed, 1u);
  EXPECT_EQ(first.delivered, 1u);
  EXPECT_EQ(worker.cursor(), 0u);
  EXPECT_EQ(worker.pending(), 2u);

  auto early = worker.poll_once(t0_ + 499ms);
  EXPECT_EQ(early.delivered + early.failed, 0u);
  EXPECT_EQ(worker.cursor(), 0u);

  auto retried = worker.poll_once(t0_ + 500ms);
  EXPECT_EQ(retried.delivered, 1u);
  EXPECT_EQ(worker.cursor(), 2u);
  EXPECT_EQ(cursors_.load(kSource, kDestination), 2u);
  EXPECT_EQ(destination_.received, (std::vector<uint8_t>{1, 2, 1}));
}

TEST_F(route_worker_test, repeated_failures_back_off_further) {
  source_.post();
  destination_.script = {error_code_t::transport_failure,
                         error_code_t::transport_failure};
  auto worker = make_worker();

  EXPECT_EQ(worker.poll_once(t0_).failed, 1u);
  EXPECT_EQ(worker.poll_once(t0_ + 500ms).failed, 1u);
  EXPECT_EQ(worker.poll_once(t0_ + 1499ms).failed, 0u);
  EXPECT_EQ(worker.poll_once(t0_ + 1500ms).delivered, 1u);
  EXPECT_EQ(worker.cursor(), 1u);
}

TEST_F(route_worker_test, terminal_rejections_count_as_settled) {
  source_.post();
  destination_.script = {error_code_t::already_delivered};
  auto worker = make_worker();

  auto summary = worker.poll_once(t0_);

  EXPECT_EQ(summary.delivered, 1u);
  EXPECT_EQ(summary.failed, 0u);
  EXPECT_EQ(worker.cursor(), 1u);
}

TEST_F(route_worker_test, skips_messages_for_other_chains) {
  source_.post(77);
  source_.post();
  auto worker = make_worker();

  auto summary = worker.poll_once(t0_);

  EXPECT_EQ(summary.skipped, 1u);
  EXPECT_EQ(summary.delivered, 1u);
  EXPECT_EQ(worker.cursor(), 2u);
  EXPECT_EQ(destination_.received, (std::vector<uint8_t>{2}));
}

TEST_F(route_worker_test, unreachable_source_is_retried_next_poll) {
  source_.post();
  source_.reachable = false;
  auto worker = make_worker();

  auto down = worker.poll_once(t0_);
  EXPECT_EQ(down.fetched, 0u);
  EXPECT_EQ(worker.cursor(), 0u);

  source_.reachable = true;
  auto up = worker.poll_once(t0_ + 1s);
  EXPECT_EQ(up.delivered, 1u);
  EXPECT_EQ(worker.cursor(), 1u);
}

TEST_F(route_worker_test, restart_resumes_after_persisted_cursor) {
  source_.post();
  source_.post();
  {
    auto worker = make_worker();
    worker.poll_once(t0_);
  }
  source_.post();

  auto restarted = make_worker();
  EXPECT_EQ(restarted.cursor(), 2u);
  auto summary = restarted.poll_once(t0_);

  EXPECT_EQ(summary.fetched, 1u);
  EXPECT_EQ(destination_.received, (std::vector<uint8_t>{1, 2, 3}));
  EXPECT_EQ(restarted.cursor(), 3u);
}

TEST_F(route_worker_test, fetches_at_most_one_batch_at_a_time) {
  for (auto i = 0; i < 5; ++i) {
    source_.post();
  }
  auto worker = make_worker(2);

  EXPECT_EQ(worker.poll_once(t0_).fetched, 2u);
  EXPECT_EQ(worker.cursor(), 2u);
  EXPECT_EQ(worker.poll_once(t0_).fetched, 2u);
  EXPECT_EQ(worker.poll_once(t0_).fetched, 1u);
  EXPECT_EQ(worker.cursor(), 5u);
}

TEST_F(route_worker_test, stuck_head_stops_fetching_beyond_batch) {
  source_.post();
  source_.post();
  source_.post();
  destination_.script = {error_code_t::transport_failure};
  auto worker = make_worker(2);

  worker.poll_once(t0_);
  auto calls = source_.calls;
  worker.poll_once(t0_ + 100ms);

  EXPECT_EQ(source_.calls, calls);
  EXPECT_EQ(worker.pending(), 2u);
  EXPECT_EQ(worker.cursor(), 0u);
}
