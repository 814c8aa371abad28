#pragma once
#include <ferry/relay/backoff.hpp>
#include <ferry/relay/chain_client.hpp>
#include <ferry/relay/cursor_store.hpp>
#include <ferry/schema/outbound_message.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>

namespace ferry::relay {

struct poll_summary final {
  std::size_t fetched{};
  std::size_t delivered{};
  std::size_t skipped{};
  std::size_t failed{};
  schema::nonce_t cursor{};
};

/// Moves messages from one source mailbox into one destination endpoint.
/// Delivery is at-least-once: the cursor only advances over a contiguous run
/// of settled nonces and is persisted after every advance.
class route_worker final {
 public:
  using time_point_t = std::chrono::steady_clock::time_point;

  route_worker(chain_client& source,
               chain_client& destination,
               cursor_store& cursors,
               backoff_policy backoff,
               std::size_t batch_size = 64);

  poll_summary poll_once(time_point_t now);

  /// Polls until `stop` is set.
  void run(const std::atomic<bool>& stop,
           std::chrono::milliseconds poll_interval);

  schema::nonce_t cursor() const { return cursor_; }
  std::size_t pending() const { return pending_.size(); }

 private:
  struct pending_entry final {
    schema::outbound_message_t message;
    uint32_t failures{};
    time_point_t next_attempt{};
    bool settled{};
  };

  void fetch(time_point_t now, poll_summary& summary);
  void attempt(pending_entry& entry, time_point_t now, poll_summary& summary);
  void advance_cursor();

  chain_client& source_;
  chain_client& destination_;
  cursor_store& cursors_;
  backoff_policy backoff_;
  std::size_t batch_size_;
  schema::nonce_t cursor_{};
  schema::nonce_t fetched_through_{};
  std::map<schema::nonce_t, pending_entry> pending_;
};

}  // namespace ferry::relay
