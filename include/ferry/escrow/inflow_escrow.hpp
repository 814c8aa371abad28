#pragma once
#include <ferry/execution/context.hpp>
#include <ferry/gmp/endpoint.hpp>
#include <ferry/gmp/message_handler.hpp>
#include <ferry/schema/enum_string.hpp>
#include <ferry/schema/escrow_state.hpp>
#include <ferry/schema/operation_result.hpp>
#include <ferry/schema/requirements_state.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace ferry::escrow {

// How an open escrow gets released. A deployment runs exactly one path.
enum class release_mode_t : uint8_t { gmp = 0, signer = 1 };

inline constexpr auto kReleaseModeMappings = std::array{
    schema::enum_mapping_t<release_mode_t>{"gmp", release_mode_t::gmp},
    schema::enum_mapping_t<release_mode_t>{"signer", release_mode_t::signer}};

}  // namespace ferry::escrow

namespace ferry::schema {

template <>
inline std::optional<ferry::escrow::release_mode_t>
try_from_string<ferry::escrow::release_mode_t>(const std::string_view value) {
  return from_string(value, ferry::escrow::kReleaseModeMappings);
}

}  // namespace ferry::schema

namespace ferry::escrow {

inline constexpr std::string_view to_string(const release_mode_t value) {
  return schema::to_string(value, kReleaseModeMappings).value_or("unknown");
}

inline constexpr auto kDefaultExpiry = schema::duration_seconds_t{120};

struct escrow_config final {
  // Handler address and custody account.
  schema::address_t address{};
  schema::chain_id_t hub_chain_id{};
  // Hub handler that receives escrow confirmations. Zero disables them.
  schema::address_t hub_addr{};
  schema::duration_seconds_t default_expiry{kDefaultExpiry};
  release_mode_t release_mode{release_mode_t::gmp};
  std::optional<schema::signer_id_t> claim_signer;
};

/// Connected-chain escrow for inflow intents. Locks the requester's tokens
/// until a fulfillment proof (or a trusted signature) releases them to the
/// solver, or until the requester cancels after expiry.
class inflow_escrow final : public gmp::message_handler {
 public:
  inflow_escrow(escrow_config config, gmp::endpoint& endpoint);

  const schema::address_t& address() const override { return config_.address; }

  schema::operation_result_t on_message(
      execution::context& ctx,
      schema::chain_id_t src_chain_id,
      const schema::address_t& src_addr,
      const schema::message_t& message) override;

  /// Requester is the caller. A zero solver is taken from the stored
  /// requirements and rejected when they pin none. A missing or
  /// zero duration uses the configured default, unless requirements for the
  /// intent pin an expiry.
  schema::operation_result_t create(
      execution::context& ctx,
      const schema::intent_id_t& intent_id,
      schema::amount_t amount,
      const schema::address_t& token,
      const schema::address_t& solver,
      std::optional<schema::duration_seconds_t> expiry_duration);

  schema::operation_result_t cancel(execution::context& ctx,
                                    const schema::intent_id_t& intent_id);

  /// Signer-mode release over `intent_id` bytes.
  schema::operation_result_t claim(execution::context& ctx,
                                   const schema::intent_id_t& intent_id,
                                   const schema::signature_t& signature);

  std::optional<schema::escrow_state_t> escrow(
      execution::context& ctx,
      const schema::intent_id_t& intent_id) const;
  std::optional<schema::requirements_state_t> requirements(
      execution::context& ctx,
      const schema::intent_id_t& intent_id) const;

  const escrow_config& config() const { return config_; }

 private:
  schema::operation_result_t on_intent_requirements(
      execution::context& ctx,
      schema::chain_id_t src_chain_id,
      const schema::address_t& src_addr,
      const schema::intent_requirements_t& message);
  schema::operation_result_t on_fulfillment_proof(
      execution::context& ctx,
      const schema::fulfillment_proof_t& message);
  schema::operation_result_t release(execution::context& ctx,
                                     schema::escrow_state_t& record,
                                     const schema::address_t& solver);

  escrow_config config_;
  gmp::endpoint& endpoint_;
};

}  // namespace ferry::escrow
