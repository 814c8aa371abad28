#pragma once
#include <ferry/escrow/inflow_escrow.hpp>
#include <ferry/execution/context.hpp>
#include <ferry/execution/write_set.hpp>
#include <ferry/gmp/endpoint.hpp>
#include <ferry/hub/hub_intents.hpp>
#include <ferry/outflow/outflow_validator.hpp>
#include <ferry/schema/enum_string.hpp>
#include <ferry/schema/operation_result.hpp>
#include <ferry/storage/rocksdb/storage.hpp>

#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace ferry::node {

enum class chain_role_t : uint8_t { hub = 0, connected = 1 };

inline constexpr auto kChainRoleMappings = std::array{
    schema::enum_mapping_t<chain_role_t>{"hub", chain_role_t::hub},
    schema::enum_mapping_t<chain_role_t>{"connected", chain_role_t::connected}};

inline constexpr std::string_view to_string(const chain_role_t value) {
  return schema::to_string(value, kChainRoleMappings).value_or("unknown");
}

struct chain_config final {
  schema::chain_id_t chain_id{};
  chain_role_t role{chain_role_t::connected};
  schema::address_t admin{};
  escrow::escrow_config escrow;
  outflow::outflow_config outflow;
  hub::hub_config hub;
};

/// One logical chain: endpoint plus the modules its role hosts. Every public
/// operation runs under one lock with its own write set, and commits only
/// when it succeeds.
class chain_node final {
 public:
  using time_source_t = std::function<schema::timestamp_seconds_t()>;

  chain_node(chain_config config,
             const storage::rocksdb_storage_t& storage,
             time_source_t now);

  chain_node(const chain_node&) = delete;
  chain_node& operator=(const chain_node&) = delete;

  schema::chain_id_t chain_id() const { return config_.chain_id; }
  chain_role_t role() const { return config_.role; }
  const chain_config& config() const { return config_; }

  // endpoint
  schema::operation_result_t deliver(const schema::address_t& relay,
                                     schema::chain_id_t src_chain_id,
                                     const schema::address_t& src_addr,
                                     const schema::bytes_view_t& payload);
  std::vector<schema::outbound_message_t> list_outbound(
      schema::nonce_t after,
      std::size_t limit) const;
  schema::nonce_t next_nonce() const;
  bool is_delivered(const schema::intent_id_t& intent_id,
                    schema::message_type_t type) const;

  schema::operation_result_t add_relay(const schema::address_t& caller,
                                       const schema::address_t& relay);
  schema::operation_result_t remove_relay(const schema::address_t& caller,
                                          const schema::address_t& relay);
  bool is_relay_authorized(const schema::address_t& relay) const;
  schema::operation_result_t set_remote_endpoint(
      const schema::address_t& caller,
      schema::chain_id_t chain_id,
      const schema::address_t& address);
  schema::operation_result_t add_remote_endpoint(
      const schema::address_t& caller,
      schema::chain_id_t chain_id,
      const schema::address_t& address);
  bool has_remote_endpoint(schema::chain_id_t chain_id) const;
  schema::operation_result_t set_handlers(
      const schema::address_t& caller,
      schema::message_type_t type,
      std::vector<schema::address_t> handlers);

  // tokens
  schema::operation_result_t mint(const schema::address_t& caller,
                                  const schema::address_t& token,
                                  const schema::address_t& account,
                                  schema::amount_t amount);
  schema::amount_t balance_of(const schema::address_t& token,
                              const schema::address_t& account) const;

  // connected chain: escrow
  schema::operation_result_t create_escrow(
      const schema::address_t& caller,
      const schema::intent_id_t& intent_id,
      schema::amount_t amount,
      const schema::address_t& token,
      const schema::address_t& solver,
      std::optional<schema::duration_seconds_t> expiry_duration);
  schema::operation_result_t cancel_escrow(
      const schema::address_t& caller,
      const schema::intent_id_t& intent_id);
  schema::operation_result_t claim_escrow(
      const schema::address_t& caller,
      const schema::intent_id_t& intent_id,
      const schema::signature_t& signature);
  std::optional<schema::escrow_state_t> escrow(
      const schema::intent_id_t& intent_id) const;
  std::optional<schema::requirements_state_t> escrow_requirements(
      const schema::intent_id_t& intent_id) const;

  // connected chain: outflow
  schema::operation_result_t fulfill_intent(
      const schema::address_t& caller,
      const schema::intent_id_t& intent_id,
      const schema::address_t& token);
  std::optional<schema::requirements_state_t> outflow_requirements(
      const schema::intent_id_t& intent_id) const;

  // hub
  schema::operation_result_t create_outflow_intent(
      const schema::address_t& caller,
      const hub::hub_intent_params& params);
  schema::operation_result_t create_inflow_intent(
      const schema::address_t& caller,
      const hub::hub_intent_params& params);
  schema::operation_result_t fulfill_inflow_intent(
      const schema::address_t& caller,
      const schema::intent_id_t& intent_id);
  schema::operation_result_t cancel_intent(
      const schema::address_t& caller,
      const schema::intent_id_t& intent_id);
  std::optional<schema::hub_intent_state_t> hub_intent(
      const schema::intent_id_t& intent_id) const;

 private:
  template <typename Fn>
  schema::operation_result_t execute(const schema::address_t& caller,
                                     std::string_view operation,
                                     Fn&& fn);
  template <typename Fn>
  auto query(Fn&& fn) const;

  void install_default_routes(execution::context& ctx);

  chain_config config_;
  const storage::rocksdb_storage_t& storage_;
  time_source_t now_;
  mutable encoder_t encoder_;
  mutable std::mutex mutex_;
  gmp::endpoint endpoint_;
  std::unique_ptr<escrow::inflow_escrow> escrow_;
  std::unique_ptr<outflow::outflow_validator> outflow_;
  std::unique_ptr<hub::hub_intents> hub_;
};

/// Wall clock in whole seconds since the Unix epoch.
schema::timestamp_seconds_t system_seconds();

}  // namespace ferry::node

namespace ferry::schema {

template <>
inline std::optional<ferry::node::chain_role_t>
try_from_string<ferry::node::chain_role_t>(const std::string_view value) {
  return from_string(value, ferry::node::kChainRoleMappings);
}

}  // namespace ferry::schema
