#pragma once
#include <ferry/execution/context.hpp>
#include <ferry/gmp/endpoint.hpp>
#include <ferry/gmp/message_handler.hpp>
#include <ferry/schema/operation_result.hpp>
#include <ferry/schema/requirements_state.hpp>

#include <optional>

namespace ferry::outflow {

struct outflow_config final {
  schema::address_t address{};
  schema::chain_id_t hub_chain_id{};
  // Hub handler that receives fulfillment proofs.
  schema::address_t hub_addr{};
};

/// Connected-chain side of outflow intents. Stores the hub's requirements and
/// lets a solver pay the requester directly, then proves it to the hub.
class outflow_validator final : public gmp::message_handler {
 public:
  outflow_validator(outflow_config config, gmp::endpoint& endpoint);

  const schema::address_t& address() const override { return config_.address; }

  schema::operation_result_t on_message(
      execution::context& ctx,
      schema::chain_id_t src_chain_id,
      const schema::address_t& src_addr,
      const schema::message_t& message) override;

  /// Solver is the caller.
  schema::operation_result_t fulfill_intent(
      execution::context& ctx,
      const schema::intent_id_t& intent_id,
      const schema::address_t& token);

  std::optional<schema::requirements_state_t> requirements(
      execution::context& ctx,
      const schema::intent_id_t& intent_id) const;

 private:
  outflow_config config_;
  gmp::endpoint& endpoint_;
};

}  // namespace ferry::outflow
