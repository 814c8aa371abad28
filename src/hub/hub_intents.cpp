#include <ferry/codec/message_codec.hpp>
#include <ferry/execution/token_book.hpp>
#include <ferry/hub/hub_intents.hpp>
#include <ferry/schema/key/ledger_keys.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ferry::hub {

namespace {

schema::operation_result_t reject(const schema::error_code_t code,
                                  std::string log) {
  return schema::make_error_result(code, schema::kCodespaceHub,
                                   std::move(log));
}

schema::operation_result_t reject_closed(
    const schema::hub_intent_state_t& state) {
  if (state.status == schema::hub_intent_status_t::cancelled) {
    return reject(schema::error_code_t::already_cancelled,
                  "intent already cancelled");
  }
  return reject(schema::error_code_t::already_fulfilled,
                "intent already fulfilled");
}

bool is_closed(const schema::hub_intent_state_t& state) {
  return state.status == schema::hub_intent_status_t::fulfilled ||
         state.status == schema::hub_intent_status_t::cancelled;
}

}  // namespace

hub_intents::hub_intents(hub_config config, gmp::endpoint& endpoint)
    : config_{std::move(config)}, endpoint_{endpoint} {}

void hub_intents::store(execution::context& ctx,
                        const schema::hub_intent_state_t& state) {
  ctx.state.put(schema::key::make_hub_intent_key(state.intent_id), state);
}

std::optional<schema::hub_intent_state_t> hub_intents::intent(
    execution::context& ctx,
    const schema::intent_id_t& intent_id) const {
  return ctx.state.get<schema::hub_intent_state_t>(
      schema::key::make_hub_intent_key(intent_id));
}

schema::operation_result_t hub_intents::on_message(
    execution::context& ctx,
    const schema::chain_id_t,
    const schema::address_t&,
    const schema::message_t& message) {
  return std::visit(
      overloaded{
          [&](const schema::escrow_confirmation_t& body) {
            return on_escrow_confirmation(ctx, body);
          },
          [&](const schema::fulfillment_proof_t& body) {
            return on_fulfillment_proof(ctx, body);
          },
          [&](const schema::intent_requirements_t&) {
            return reject(schema::error_code_t::unsupported_message,
                          "hub does not consume intent requirements");
          }},
      message);
}

schema::operation_result_t hub_intents::create_outflow_intent(
    execution::context& ctx,
    const hub_intent_params& params) {
  return create_intent(ctx, params, schema::intent_flow_t::outflow);
}

schema::operation_result_t hub_intents::create_inflow_intent(
    execution::context& ctx,
    const hub_intent_params& params) {
  return create_intent(ctx, params, schema::intent_flow_t::inflow);
}

schema::operation_result_t hub_intents::create_intent(
    execution::context& ctx,
    const hub_intent_params& params,
    const schema::intent_flow_t flow) {
  if (intent(ctx, params.intent_id)) {
    return reject(schema::error_code_t::already_exists,
                  "intent already exists");
  }
  if (params.connected_amount == 0 || params.hub_amount == 0) {
    return reject(schema::error_code_t::zero_amount,
                  "intent amounts must be positive");
  }
  if (params.expiry <= ctx.now) {
    return reject(schema::error_code_t::expired,
                  "intent expiry is not in the future");
  }
  if (schema::is_zero(params.connected_handler_addr)) {
    return reject(schema::error_code_t::invalid_address,
                  "connected chain handler is zero");
  }

  if (flow == schema::intent_flow_t::outflow) {
    auto locked = execution::transfer(ctx, params.hub_token_addr, ctx.caller,
                                      config_.address, params.hub_amount);
    if (!locked.ok()) {
      return locked;
    }
  }

  auto state = schema::hub_intent_state_t{
      .intent_id = params.intent_id,
      .flow = flow,
      .status = schema::hub_intent_status_t::requirements_sent,
      .requester_addr = ctx.caller,
      .solver_addr = params.solver_addr,
      .connected_chain_id = params.connected_chain_id,
      .connected_handler_addr = params.connected_handler_addr,
      .connected_token_addr = params.connected_token_addr,
      .connected_amount = params.connected_amount,
      .hub_token_addr = params.hub_token_addr,
      .hub_amount = params.hub_amount,
      .created_at = ctx.now,
      .expiry = params.expiry};
  store(ctx, state);

  auto requirements = codec::encode(
      schema::intent_requirements_t{.intent_id = params.intent_id,
                                    .requester_addr = ctx.caller,
                                    .amount_required = params.connected_amount,
                                    .token_addr = params.connected_token_addr,
                                    .solver_addr = params.solver_addr,
                                    .expiry = params.expiry});
  auto sent = endpoint_.send(ctx, config_.address, params.connected_chain_id,
                             params.connected_handler_addr,
                             schema::make_bytes_view(requirements));
  if (!sent.ok()) {
    return sent;
  }

  ctx.emit("intent_created",
           {execution::make_attribute("intent_id", params.intent_id, true),
            execution::make_attribute("flow",
                                      std::string{schema::to_string(flow)}),
            execution::make_attribute("requester", ctx.caller, true),
            execution::make_attribute("connected_chain_id",
                                      params.connected_chain_id),
            execution::make_attribute("expiry", params.expiry)});
  spdlog::info("{} intent {} created for chain {}", schema::to_string(flow),
               schema::to_hex(params.intent_id), params.connected_chain_id);
  return sent;
}

schema::operation_result_t hub_intents::on_escrow_confirmation(
    execution::context& ctx,
    const schema::escrow_confirmation_t& message) {
  auto state = intent(ctx, message.intent_id);
  if (!state || state->flow != schema::intent_flow_t::inflow) {
    ctx.emit("confirmation_untracked",
             {execution::make_attribute("intent_id", message.intent_id, true)});
    return {};
  }
  if (state->status != schema::hub_intent_status_t::requirements_sent) {
    return {};
  }

  auto problem = std::string{};
  if (message.token_addr != state->connected_token_addr) {
    problem = "escrowed token differs from the intent";
  } else if (message.amount_escrowed < state->connected_amount) {
    problem = fmt::format("escrowed {} below required {}",
                          message.amount_escrowed, state->connected_amount);
  } else if (message.creator_addr != state->requester_addr) {
    problem = "escrow creator is not the requester";
  }
  if (!problem.empty()) {
    ctx.emit("confirmation_rejected",
             {execution::make_attribute("intent_id", message.intent_id, true),
              execution::make_attribute("reason", problem)});
    spdlog::warn("escrow confirmation for intent {} rejected: {}",
                 schema::to_hex(message.intent_id), problem);
    return {};
  }

  state->status = schema::hub_intent_status_t::escrow_confirmed;
  state->escrow_id = message.escrow_id;
  store(ctx, *state);
  ctx.emit("escrow_confirmed",
           {execution::make_attribute("intent_id", message.intent_id, true),
            execution::make_attribute("escrow_id", message.escrow_id),
            execution::make_attribute("amount", message.amount_escrowed)});
  spdlog::info("escrow confirmed for intent {}",
               schema::to_hex(message.intent_id));
  return {};
}

schema::operation_result_t hub_intents::on_fulfillment_proof(
    execution::context& ctx,
    const schema::fulfillment_proof_t& message) {
  auto state = intent(ctx, message.intent_id);
  if (!state || state->flow != schema::intent_flow_t::outflow) {
    ctx.emit("proof_untracked",
             {execution::make_attribute("intent_id", message.intent_id, true)});
    return {};
  }
  if (is_closed(*state)) {
    return reject_closed(*state);
  }

  auto solver = schema::is_zero(state->solver_addr) ? message.solver_addr
                                                    : state->solver_addr;
  auto paid = execution::transfer(ctx, state->hub_token_addr, config_.address,
                                  solver, state->hub_amount);
  if (!paid.ok()) {
    return paid;
  }
  state->status = schema::hub_intent_status_t::fulfilled;
  state->fulfilled_by = solver;
  store(ctx, *state);
  ctx.emit("intent_fulfilled",
           {execution::make_attribute("intent_id", message.intent_id, true),
            execution::make_attribute("solver", solver, true),
            execution::make_attribute("amount", state->hub_amount)});
  spdlog::info("outflow intent {} settled to solver {}",
               schema::to_hex(message.intent_id), schema::to_hex(solver));
  return {};
}

schema::operation_result_t hub_intents::fulfill_inflow_intent(
    execution::context& ctx,
    const schema::intent_id_t& intent_id) {
  auto state = intent(ctx, intent_id);
  if (!state) {
    return reject(schema::error_code_t::does_not_exist, "unknown intent");
  }
  if (state->flow != schema::intent_flow_t::inflow) {
    return reject(schema::error_code_t::invalid_intent,
                  "outflow intents are fulfilled on the connected chain");
  }
  if (is_closed(*state)) {
    return reject_closed(*state);
  }
  if (state->status != schema::hub_intent_status_t::escrow_confirmed) {
    return reject(schema::error_code_t::escrow_not_confirmed,
                  "escrow not confirmed yet");
  }
  if (ctx.now > state->expiry) {
    return reject(schema::error_code_t::expired,
                  fmt::format("intent expired at {}", state->expiry));
  }
  if (!schema::is_zero(state->solver_addr) &&
      ctx.caller != state->solver_addr) {
    return reject(schema::error_code_t::unauthorized_solver,
                  "caller is not the pinned solver");
  }

  auto paid = execution::transfer(ctx, state->hub_token_addr, ctx.caller,
                                  state->requester_addr, state->hub_amount);
  if (!paid.ok()) {
    return paid;
  }
  state->status = schema::hub_intent_status_t::fulfilled;
  state->fulfilled_by = ctx.caller;
  store(ctx, *state);

  auto proof = codec::encode(
      schema::fulfillment_proof_t{.intent_id = intent_id,
                                  .solver_addr = ctx.caller,
                                  .amount_fulfilled = state->hub_amount,
                                  .timestamp = ctx.now});
  auto sent = endpoint_.send(ctx, config_.address, state->connected_chain_id,
                             state->connected_handler_addr,
                             schema::make_bytes_view(proof));
  if (!sent.ok()) {
    return sent;
  }
  ctx.emit("intent_fulfilled",
           {execution::make_attribute("intent_id", intent_id, true),
            execution::make_attribute("solver", ctx.caller, true),
            execution::make_attribute("amount", state->hub_amount)});
  spdlog::info("inflow intent {} fulfilled by {}", schema::to_hex(intent_id),
               schema::to_hex(ctx.caller));
  return sent;
}

schema::operation_result_t hub_intents::cancel_intent(
    execution::context& ctx,
    const schema::intent_id_t& intent_id) {
  auto state = intent(ctx, intent_id);
  if (!state) {
    return reject(schema::error_code_t::does_not_exist, "unknown intent");
  }
  if (ctx.caller != state->requester_addr) {
    return reject(schema::error_code_t::unauthorized_requester,
                  "only the requester can cancel");
  }
  if (is_closed(*state)) {
    return reject_closed(*state);
  }
  if (ctx.now <= state->expiry) {
    return reject(schema::error_code_t::not_expired_yet,
                  fmt::format("intent expires at {}", state->expiry));
  }
  if (state->flow == schema::intent_flow_t::outflow) {
    auto refunded =
        execution::transfer(ctx, state->hub_token_addr, config_.address,
                            state->requester_addr, state->hub_amount);
    if (!refunded.ok()) {
      return refunded;
    }
  }
  state->status = schema::hub_intent_status_t::cancelled;
  store(ctx, *state);
  ctx.emit("intent_cancelled",
           {execution::make_attribute("intent_id", intent_id, true),
            execution::make_attribute("requester", state->requester_addr)});
  spdlog::info("intent {} cancelled", schema::to_hex(intent_id));
  return {};
}

}  // namespace ferry::hub
