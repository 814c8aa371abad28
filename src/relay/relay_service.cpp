#include <ferry/relay/relay_service.hpp>

#include <spdlog/spdlog.h>

namespace ferry::relay {

relay_service::relay_service(cursor_store& cursors, relay_options options)
    : cursors_{cursors}, options_{options} {}

relay_service::~relay_service() {
  stop();
  join();
}

void relay_service::add_route(chain_client& source, chain_client& destination) {
  workers_.push_back(std::make_unique<route_worker>(
      source, destination, cursors_, options_.backoff, options_.batch_size));
}

poll_summary relay_service::poll_once() {
  auto total = poll_summary{};
  auto now = std::chrono::steady_clock::now();
  for (auto& worker : workers_) {
    auto summary = worker->poll_once(now);
    total.fetched += summary.fetched;
    total.delivered += summary.delivered;
    total.skipped += summary.skipped;
    total.failed += summary.failed;
  }
  return total;
}

void relay_service::start() {
  stop_requested_ = false;
  for (auto& worker : workers_) {
    threads_.emplace_back([this, w = worker.get()]() {
      w->run(stop_requested_, options_.poll_interval);
    });
  }
  spdlog::info("relay started with {} routes", workers_.size());
}

void relay_service::stop() {
  stop_requested_ = true;
}

void relay_service::join() {
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  threads_.clear();
}

}  // namespace ferry::relay
