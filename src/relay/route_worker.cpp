#include <ferry/relay/route_worker.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>

namespace ferry::relay {

route_worker::route_worker(chain_client& source,
                           chain_client& destination,
                           cursor_store& cursors,
                           backoff_policy backoff,
                           const std::size_t batch_size)
    : source_{source},
      destination_{destination},
      cursors_{cursors},
      backoff_{backoff},
      batch_size_{std::max<std::size_t>(batch_size, 1)},
      cursor_{cursors.load(source.chain_id(), destination.chain_id())},
      fetched_through_{cursor_} {
  spdlog::info("route {} -> {} resuming after nonce {}", source_.chain_id(),
               destination_.chain_id(), cursor_);
}

poll_summary route_worker::poll_once(const time_point_t now) {
  auto summary = poll_summary{};
  fetch(now, summary);
  for (auto& [nonce, entry] : pending_) {
    if (!entry.settled && entry.next_attempt <= now) {
      attempt(entry, now, summary);
    }
  }
  advance_cursor();
  summary.cursor = cursor_;
  return summary;
}

void route_worker::fetch(const time_point_t now, poll_summary& summary) {
  if (pending_.size() >= batch_size_) {
    return;
  }
  auto messages =
      source_.list_outbound(fetched_through_, batch_size_ - pending_.size());
  if (!messages) {
    spdlog::warn("route {} -> {}: source unreachable", source_.chain_id(),
                 destination_.chain_id());
    return;
  }
  for (auto& message : *messages) {
    if (message.nonce <= fetched_through_) {
      continue;
    }
    fetched_through_ = message.nonce;
    auto nonce = message.nonce;
    pending_.emplace(nonce, pending_entry{.message = std::move(message),
                                          .next_attempt = now});
    ++summary.fetched;
  }
}

void route_worker::attempt(pending_entry& entry,
                           const time_point_t now,
                           poll_summary& summary) {
  const auto& message = entry.message;
  if (message.dst_chain_id != destination_.chain_id()) {
    entry.settled = true;
    ++summary.skipped;
    return;
  }

  auto result = destination_.deliver(source_.chain_id(), message.src_addr,
                                     schema::make_bytes_view(message.payload));
  if (result.ok() || schema::is_terminal(result.code)) {
    if (!result.ok()) {
      spdlog::debug("route {} -> {}: nonce {} already settled ({})",
                    source_.chain_id(), destination_.chain_id(), message.nonce,
                    schema::to_string(result.code));
    }
    entry.settled = true;
    ++summary.delivered;
    return;
  }

  ++entry.failures;
  auto delay = backoff_.delay(entry.failures);
  entry.next_attempt = now + delay;
  ++summary.failed;
  spdlog::warn(
      "route {} -> {}: nonce {} failed with {} ({}), attempt {} retry in {}ms",
      source_.chain_id(), destination_.chain_id(), message.nonce,
      schema::to_string(result.code), result.log, entry.failures,
      delay.count());
}

void route_worker::advance_cursor() {
  auto advanced = cursor_;
  while (!pending_.empty() && pending_.begin()->second.settled) {
    advanced = pending_.begin()->first;
    pending_.erase(pending_.begin());
  }
  if (advanced != cursor_) {
    cursor_ = advanced;
    cursors_.save(source_.chain_id(), destination_.chain_id(), cursor_);
  }
}

void route_worker::run(const std::atomic<bool>& stop,
                       const std::chrono::milliseconds poll_interval) {
  static constexpr auto kSlice = std::chrono::milliseconds{100};
  while (!stop) {
    auto summary = poll_once(std::chrono::steady_clock::now());
    if (summary.delivered > 0 || summary.failed > 0) {
      spdlog::info("route {} -> {}: delivered {} failed {} cursor {}",
                   source_.chain_id(), destination_.chain_id(),
                   summary.delivered, summary.failed, summary.cursor);
    }
    auto waited = std::chrono::milliseconds{0};
    while (!stop && waited < poll_interval) {
      auto step = std::min(kSlice, poll_interval - waited);
      std::this_thread::sleep_for(step);
      waited += step;
    }
  }
}

}  // namespace ferry::relay
