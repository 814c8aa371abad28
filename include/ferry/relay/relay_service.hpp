#pragma once
#include <ferry/relay/backoff.hpp>
#include <ferry/relay/chain_client.hpp>
#include <ferry/relay/cursor_store.hpp>
#include <ferry/relay/route_worker.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace ferry::relay {

struct relay_options final {
  backoff_policy backoff;
  std::size_t batch_size{64};
  std::chrono::milliseconds poll_interval{1000};
};

/// One route_worker per directed chain pair, each on its own thread.
class relay_service final {
 public:
  relay_service(cursor_store& cursors, relay_options options);
  ~relay_service();

  relay_service(const relay_service&) = delete;
  relay_service& operator=(const relay_service&) = delete;

  void add_route(chain_client& source, chain_client& destination);

  /// Single pass over every route on the calling thread.
  poll_summary poll_once();

  void start();
  void stop();
  void join();

  std::size_t routes() const { return workers_.size(); }

 private:
  cursor_store& cursors_;
  relay_options options_;
  std::atomic<bool> stop_requested_{false};
  std::vector<std::unique_ptr<route_worker>> workers_;
  std::vector<std::thread> threads_;
};

}  // namespace ferry::relay
