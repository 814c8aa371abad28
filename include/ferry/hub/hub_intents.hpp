#pragma once
#include <ferry/execution/context.hpp>
#include <ferry/gmp/endpoint.hpp>
#include <ferry/gmp/message_handler.hpp>
#include <ferry/schema/hub_intent_state.hpp>
#include <ferry/schema/operation_result.hpp>

#include <optional>

namespace ferry::hub {

struct hub_config final {
  // Handler address and custody account for locked outflow offers.
  schema::address_t address{};
};

// For outflow intents the hub side is the locked offer and the connected side
// is what the solver pays out. For inflow intents the connected side is what
// the requester escrows and the hub side is what the solver pays on the hub.
struct hub_intent_params final {
  schema::intent_id_t intent_id{};
  schema::chain_id_t connected_chain_id{};
  schema::address_t connected_handler_addr{};
  schema::address_t connected_token_addr{};
  schema::amount_t connected_amount{};
  schema::address_t hub_token_addr{};
  schema::amount_t hub_amount{};
  // Zero means any solver.
  schema::address_t solver_addr{};
  schema::timestamp_seconds_t expiry{};
};

/// Hub-side intent book. Creating an intent sends its requirements to the
/// connected chain; confirmations and proofs coming back advance it.
class hub_intents final : public gmp::message_handler {
 public:
  hub_intents(hub_config config, gmp::endpoint& endpoint);

  const schema::address_t& address() const override { return config_.address; }

  schema::operation_result_t on_message(
      execution::context& ctx,
      schema::chain_id_t src_chain_id,
      const schema::address_t& src_addr,
      const schema::message_t& message) override;

  schema::operation_result_t create_outflow_intent(
      execution::context& ctx,
      const hub_intent_params& params);
  schema::operation_result_t create_inflow_intent(
      execution::context& ctx,
      const hub_intent_params& params);

  /// Solver is the caller. Requires a confirmed escrow.
  schema::operation_result_t fulfill_inflow_intent(
      execution::context& ctx,
      const schema::intent_id_t& intent_id);

  /// Requester only, strictly after expiry.
  schema::operation_result_t cancel_intent(
      execution::context& ctx,
      const schema::intent_id_t& intent_id);

  std::optional<schema::hub_intent_state_t> intent(
      execution::context& ctx,
      const schema::intent_id_t& intent_id) const;

 private:
  schema::operation_result_t create_intent(execution::context& ctx,
                                           const hub_intent_params& params,
                                           schema::intent_flow_t flow);
  schema::operation_result_t on_escrow_confirmation(
      execution::context& ctx,
      const schema::escrow_confirmation_t& message);
  schema::operation_result_t on_fulfillment_proof(
      execution::context& ctx,
      const schema::fulfillment_proof_t& message);
  void store(execution::context& ctx, const schema::hub_intent_state_t& state);

  hub_config config_;
  gmp::endpoint& endpoint_;
};

}  // namespace ferry::hub
