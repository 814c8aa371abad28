#include <ferry/codec/message_codec.hpp>
#include <ferry/execution/token_book.hpp>
#include <ferry/outflow/outflow_validator.hpp>
#include <ferry/schema/key/ledger_keys.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ferry::outflow {

namespace {

schema::operation_result_t reject(const schema::error_code_t code,
                                  std::string log) {
  return schema::make_error_result(code, schema::kCodespaceOutflow,
                                   std::move(log));
}

}  // namespace

outflow_validator::outflow_validator(outflow_config config,
                                     gmp::endpoint& endpoint)
    : config_{std::move(config)}, endpoint_{endpoint} {}

schema::operation_result_t outflow_validator::on_message(
    execution::context& ctx,
    const schema::chain_id_t src_chain_id,
    const schema::address_t& src_addr,
    const schema::message_t& message) {
  const auto* body = std::get_if<schema::intent_requirements_t>(&message);
  if (body == nullptr) {
    return reject(schema::error_code_t::unsupported_message,
                  fmt::format("outflow validator does not consume {}",
                              schema::to_string(schema::type_of(message))));
  }

  auto key = schema::key::make_outflow_requirements_key(body->intent_id);
  if (ctx.state.contains(key)) {
    ctx.emit("requirements_duplicate",
             {execution::make_attribute("intent_id", body->intent_id, true)});
    spdlog::warn("duplicate outflow requirements for intent {}",
                 schema::to_hex(body->intent_id));
    return {};
  }
  ctx.state.put(key, schema::requirements_state_t{.requirements = *body,
                                                  .src_chain_id = src_chain_id,
                                                  .src_addr = src_addr,
                                                  .received_at = ctx.now});
  ctx.emit("requirements_received",
           {execution::make_attribute("intent_id", body->intent_id, true),
            execution::make_attribute("requester", body->requester_addr),
            execution::make_attribute("amount_required",
                                      body->amount_required),
            execution::make_attribute("expiry", body->expiry)});
  return {};
}

schema::operation_result_t outflow_validator::fulfill_intent(
    execution::context& ctx,
    const schema::intent_id_t& intent_id,
    const schema::address_t& token) {
  auto key = schema::key::make_outflow_requirements_key(intent_id);
  auto stored = ctx.state.get<schema::requirements_state_t>(key);
  if (!stored) {
    return reject(schema::error_code_t::requirements_not_found,
                  "no requirements for intent");
  }
  const auto& required = stored->requirements;
  if (stored->fulfilled) {
    return reject(schema::error_code_t::already_fulfilled,
                  "intent already fulfilled");
  }
  if (ctx.now > required.expiry) {
    return reject(schema::error_code_t::expired,
                  fmt::format("intent expired at {}", required.expiry));
  }
  if (!schema::is_zero(required.solver_addr) &&
      ctx.caller != required.solver_addr) {
    return reject(schema::error_code_t::unauthorized_solver,
                  "caller is not the pinned solver");
  }
  if (token != required.token_addr) {
    return reject(schema::error_code_t::token_mismatch,
                  "token differs from required token");
  }

  auto paid = execution::transfer(ctx, token, ctx.caller,
                                  required.requester_addr,
                                  required.amount_required);
  if (!paid.ok()) {
    return paid;
  }

  stored->fulfilled = true;
  ctx.state.put(key, *stored);

  auto proof = codec::encode(
      schema::fulfillment_proof_t{.intent_id = intent_id,
                                  .solver_addr = ctx.caller,
                                  .amount_fulfilled = required.amount_required,
                                  .timestamp = ctx.now});
  auto sent = endpoint_.send(ctx, config_.address, config_.hub_chain_id,
                             config_.hub_addr, schema::make_bytes_view(proof));
  if (!sent.ok()) {
    return sent;
  }

  ctx.emit("outflow_fulfilled",
           {execution::make_attribute("intent_id", intent_id, true),
            execution::make_attribute("solver", ctx.caller, true),
            execution::make_attribute("amount", required.amount_required)});
  spdlog::info("outflow intent {} fulfilled by {}", schema::to_hex(intent_id),
               schema::to_hex(ctx.caller));
  return sent;
}

std::optional<schema::requirements_state_t> outflow_validator::requirements(
    execution::context& ctx,
    const schema::intent_id_t& intent_id) const {
  return ctx.state.get<schema::requirements_state_t>(
      schema::key::make_outflow_requirements_key(intent_id));
}

}  // namespace ferry::outflow
