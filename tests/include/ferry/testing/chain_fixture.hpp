#pragma once

#include <ferry/codec/message_codec.hpp>
#include <ferry/node/chain_node.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <ferry/testing/common.hpp>

#include <optional>
#include <string_view>
#include <vector>

namespace ferry::testing {

inline constexpr auto kHubChainId = ferry::schema::chain_id_t{1};
inline constexpr auto kConnectedChainId = ferry::schema::chain_id_t{30};
inline constexpr auto kStartTime = ferry::schema::timestamp_seconds_t{1000};

inline const ferry::schema::address_t kAdmin = make_hash(0xA0);
inline const ferry::schema::address_t kRelay = make_hash(0xB0);
inline const ferry::schema::address_t kHubHandler = make_hash(0x10);
inline const ferry::schema::address_t kEscrowHandler = make_hash(0x20);
inline const ferry::schema::address_t kOutflowHandler = make_hash(0x30);
inline const ferry::schema::address_t kRequester = make_hash(0x40);
inline const ferry::schema::address_t kSolver = make_hash(0x50);
inline const ferry::schema::address_t kHubToken = make_hash(0x60);
inline const ferry::schema::address_t kConnectedToken = make_hash(0x70);

inline ferry::node::chain_config make_hub_config() {
  auto config = ferry::node::chain_config{};
  config.chain_id = kHubChainId;
  config.role = ferry::node::chain_role_t::hub;
  config.admin = kAdmin;
  config.hub.address = kHubHandler;
  return config;
}

inline ferry::node::chain_config make_connected_config(
    const ferry::escrow::release_mode_t release_mode =
        ferry::escrow::release_mode_t::gmp,
    std::optional<ferry::schema::signer_id_t> claim_signer = std::nullopt) {
  auto config = ferry::node::chain_config{};
  config.chain_id = kConnectedChainId;
  config.role = ferry::node::chain_role_t::connected;
  config.admin = kAdmin;
  config.escrow.address = kEscrowHandler;
  config.escrow.hub_chain_id = kHubChainId;
  config.escrow.hub_addr = kHubHandler;
  config.escrow.release_mode = release_mode;
  config.escrow.claim_signer = std::move(claim_signer);
  config.outflow.address = kOutflowHandler;
  config.outflow.hub_chain_id = kHubChainId;
  config.outflow.hub_addr = kHubHandler;
  return config;
}

/// One chain_node over its own throwaway RocksDB directory.
class node_fixture final {
 public:
  node_fixture(const std::string_view db_prefix,
               ferry::node::chain_config config,
               manual_clock& clock)
      : path_{db_prefix},
        storage_{ferry::storage::make_storage<
            ferry::storage::rocksdb_storage_tag>(path_.path())},
        node_{std::move(config), storage_, clock.source()} {}

  node_fixture(const node_fixture&) = delete;
  node_fixture& operator=(const node_fixture&) = delete;

  ferry::node::chain_node& node() { return node_; }
  ferry::storage::rocksdb_storage_t& storage() { return storage_; }
  const std::string& db_path() const { return path_.path(); }

 private:
  scoped_path path_;
  ferry::storage::rocksdb_storage_t storage_;
  ferry::node::chain_node node_;
};

/// A hub and one connected chain that trust each other's handlers and
/// accept deliveries from kRelay.
class network_fixture final {
 public:
  explicit network_fixture(
      const ferry::escrow::release_mode_t release_mode =
          ferry::escrow::release_mode_t::gmp,
      std::optional<ferry::schema::signer_id_t> claim_signer = std::nullopt)
      : clock_{kStartTime},
        hub_{"ferry_hub", make_hub_config(), clock_},
        connected_{"ferry_connected",
                   make_connected_config(release_mode, std::move(claim_signer)),
                   clock_} {
    hub().add_relay(kAdmin, kRelay);
    hub().add_remote_endpoint(kAdmin, kConnectedChainId, kEscrowHandler);
    hub().add_remote_endpoint(kAdmin, kConnectedChainId, kOutflowHandler);
    connected().add_relay(kAdmin, kRelay);
    connected().add_remote_endpoint(kAdmin, kHubChainId, kHubHandler);
  }

  manual_clock& clock() { return clock_; }
  ferry::node::chain_node& hub() { return hub_.node(); }
  ferry::node::chain_node& connected() { return connected_.node(); }
  node_fixture& hub_fixture() { return hub_; }
  node_fixture& connected_fixture() { return connected_; }

  /// Delivers every mailbox entry not yet pumped, in nonce order, and returns
  /// the delivery results.
  std::vector<ferry::schema::operation_result_t> pump() {
    auto results = std::vector<ferry::schema::operation_result_t>{};
    pump_from(hub(), connected(), hub_cursor_, results);
    pump_from(connected(), hub(), connected_cursor_, results);
    return results;
  }

 private:
  static void pump_from(
      ferry::node::chain_node& source,
      ferry::node::chain_node& destination,
      ferry::schema::nonce_t& cursor,
      std::vector<ferry::schema::operation_result_t>& results) {
    for (const auto& message : source.list_outbound(cursor, 1024)) {
      cursor = message.nonce;
      if (message.dst_chain_id != destination.chain_id()) {
        continue;
      }
      results.push_back(destination.deliver(
          kRelay, source.chain_id(), message.src_addr,
          ferry::schema::make_bytes_view(message.payload)));
    }
  }

  manual_clock clock_;
  node_fixture hub_;
  node_fixture connected_;
  ferry::schema::nonce_t hub_cursor_{};
  ferry::schema::nonce_t connected_cursor_{};
};

}  // namespace ferry::testing
