#include <ferry/codec/message_codec.hpp>
#include <ferry/crypto/verify.hpp>
#include <ferry/escrow/inflow_escrow.hpp>
#include <ferry/execution/token_book.hpp>
#include <ferry/schema/key/ledger_keys.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace ferry::escrow {

namespace {

schema::operation_result_t reject(const schema::error_code_t code,
                                  std::string log) {
  return schema::make_error_result(code, schema::kCodespaceEscrow,
                                   std::move(log));
}

schema::operation_result_t reject_closed(const schema::escrow_state_t& record) {
  if (record.status == schema::escrow_status_t::released) {
    return reject(schema::error_code_t::already_released,
                  "escrow already released");
  }
  return reject(schema::error_code_t::already_cancelled,
                "escrow already cancelled");
}

}  // namespace

inflow_escrow::inflow_escrow(escrow_config config, gmp::endpoint& endpoint)
    : config_{std::move(config)}, endpoint_{endpoint} {
  if (config_.default_expiry == 0) {
    config_.default_expiry = kDefaultExpiry;
  }
}

schema::operation_result_t inflow_escrow::on_message(
    execution::context& ctx,
    const schema::chain_id_t src_chain_id,
    const schema::address_t& src_addr,
    const schema::message_t& message) {
  return std::visit(
      overloaded{
          [&](const schema::intent_requirements_t& body) {
            return on_intent_requirements(ctx, src_chain_id, src_addr, body);
          },
          [&](const schema::fulfillment_proof_t& body) {
            return on_fulfillment_proof(ctx, body);
          },
          [&](const schema::escrow_confirmation_t&) {
            return reject(schema::error_code_t::unsupported_message,
                          "escrow does not consume escrow confirmations");
          }},
      message);
}

schema::operation_result_t inflow_escrow::on_intent_requirements(
    execution::context& ctx,
    const schema::chain_id_t src_chain_id,
    const schema::address_t& src_addr,
    const schema::intent_requirements_t& message) {
  auto key = schema::key::make_escrow_requirements_key(message.intent_id);
  if (ctx.state.contains(key)) {
    ctx.emit("requirements_duplicate",
             {execution::make_attribute("intent_id", message.intent_id, true)});
    spdlog::warn("duplicate escrow requirements for intent {}",
                 schema::to_hex(message.intent_id));
    return {};
  }
  ctx.state.put(key, schema::requirements_state_t{.requirements = message,
                                                  .src_chain_id = src_chain_id,
                                                  .src_addr = src_addr,
                                                  .received_at = ctx.now});
  ctx.emit("requirements_received",
           {execution::make_attribute("intent_id", message.intent_id, true),
            execution::make_attribute("requester", message.requester_addr),
            execution::make_attribute("amount_required",
                                      message.amount_required),
            execution::make_attribute("expiry", message.expiry)});
  return {};
}

schema::operation_result_t inflow_escrow::create(
    execution::context& ctx,
    const schema::intent_id_t& intent_id,
    const schema::amount_t amount,
    const schema::address_t& token,
    const schema::address_t& solver,
    const std::optional<schema::duration_seconds_t> expiry_duration) {
  auto escrow_key = schema::key::make_escrow_key(intent_id);
  if (ctx.state.contains(escrow_key)) {
    return reject(schema::error_code_t::already_exists,
                  "escrow already exists for intent");
  }
  if (amount == 0) {
    return reject(schema::error_code_t::zero_amount,
                  "escrow amount must be positive");
  }

  auto reserved_solver = solver;
  auto duration = expiry_duration.value_or(0);
  auto expiry = ctx.now + (duration > 0 ? duration : config_.default_expiry);

  auto requirements_key = schema::key::make_escrow_requirements_key(intent_id);
  auto stored = ctx.state.get<schema::requirements_state_t>(requirements_key);
  if (stored) {
    const auto& required = stored->requirements;
    if (stored->escrow_created) {
      return reject(schema::error_code_t::escrow_already_created,
                    "requirements already backed by an escrow");
    }
    if (ctx.caller != required.requester_addr) {
      return reject(schema::error_code_t::unauthorized_requester,
                    "caller is not the intent requester");
    }
    if (token != required.token_addr) {
      return reject(schema::error_code_t::token_mismatch,
                    "escrow token differs from required token");
    }
    if (amount < required.amount_required) {
      return reject(schema::error_code_t::amount_mismatch,
                    fmt::format("escrow amount {} below required {}", amount,
                                required.amount_required));
    }
    if (ctx.now > required.expiry) {
      return reject(schema::error_code_t::expired, "intent already expired");
    }
    if (!schema::is_zero(required.solver_addr)) {
      if (!schema::is_zero(solver) && solver != required.solver_addr) {
        return reject(schema::error_code_t::unauthorized_solver,
                      "solver differs from the required solver");
      }
      reserved_solver = required.solver_addr;
    }
    expiry = required.expiry;
    stored->escrow_created = true;
    ctx.state.put(requirements_key, *stored);
  }
  if (schema::is_zero(reserved_solver)) {
    return reject(schema::error_code_t::invalid_solver,
                  "escrow needs a reserved solver");
  }

  auto moved = execution::transfer(ctx, token, ctx.caller, config_.address,
                                   amount);
  if (!moved.ok()) {
    return moved;
  }

  auto record = schema::escrow_state_t{
      .intent_id = intent_id,
      .escrow_id = schema::key::make_escrow_id(ctx.chain_id, intent_id),
      .requester_addr = ctx.caller,
      .token_addr = token,
      .amount = amount,
      .deposited = amount,
      .reserved_solver = reserved_solver,
      .created_at = ctx.now,
      .expiry = expiry,
      .status = schema::escrow_status_t::open};
  ctx.state.put(escrow_key, record);
  ctx.emit("escrow_created",
           {execution::make_attribute("intent_id", intent_id, true),
            execution::make_attribute("escrow_id", record.escrow_id),
            execution::make_attribute("requester", record.requester_addr),
            execution::make_attribute("amount", amount),
            execution::make_attribute("expiry", expiry)});
  spdlog::info("escrow {} created for intent {} amount {} expiry {}",
               schema::to_hex(record.escrow_id), schema::to_hex(intent_id),
               amount, expiry);

  if (config_.release_mode == release_mode_t::gmp &&
      !schema::is_zero(config_.hub_addr)) {
    auto confirmation = codec::encode(schema::escrow_confirmation_t{
        .intent_id = intent_id,
        .escrow_id = record.escrow_id,
        .amount_escrowed = amount,
        .token_addr = token,
        .creator_addr = ctx.caller});
    auto sent = endpoint_.send(ctx, config_.address, config_.hub_chain_id,
                               config_.hub_addr,
                               schema::make_bytes_view(confirmation));
    if (!sent.ok()) {
      return sent;
    }
  }

  auto result = schema::operation_result_t{};
  result.data = schema::bytes_t{std::begin(record.escrow_id),
                                std::end(record.escrow_id)};
  return result;
}

schema::operation_result_t inflow_escrow::on_fulfillment_proof(
    execution::context& ctx,
    const schema::fulfillment_proof_t& message) {
  if (config_.release_mode != release_mode_t::gmp) {
    return reject(schema::error_code_t::release_path_disabled,
                  "escrow releases by signature on this chain");
  }
  auto record = escrow(ctx, message.intent_id);
  if (!record) {
    return reject(schema::error_code_t::does_not_exist,
                  "no escrow for fulfilled intent");
  }
  if (record->status != schema::escrow_status_t::open) {
    return reject_closed(*record);
  }
  if (message.solver_addr != record->reserved_solver) {
    spdlog::warn("proof for intent {} names solver {}, paying reserved {}",
                 schema::to_hex(message.intent_id),
                 schema::to_hex(message.solver_addr),
                 schema::to_hex(record->reserved_solver));
  }

  auto requirements_key =
      schema::key::make_escrow_requirements_key(message.intent_id);
  auto stored = ctx.state.get<schema::requirements_state_t>(requirements_key);
  if (stored) {
    stored->fulfilled = true;
    ctx.state.put(requirements_key, *stored);
  }
  return release(ctx, *record, record->reserved_solver);
}

schema::operation_result_t inflow_escrow::claim(
    execution::context& ctx,
    const schema::intent_id_t& intent_id,
    const schema::signature_t& signature) {
  if (config_.release_mode != release_mode_t::signer ||
      !config_.claim_signer) {
    return reject(schema::error_code_t::release_path_disabled,
                  "escrow releases by fulfillment proof on this chain");
  }
  auto record = escrow(ctx, intent_id);
  if (!record) {
    return reject(schema::error_code_t::does_not_exist, "no escrow for intent");
  }
  if (record->status != schema::escrow_status_t::open) {
    return reject_closed(*record);
  }
  if (ctx.caller != record->reserved_solver) {
    return reject(schema::error_code_t::unauthorized_solver,
                  "caller is not the reserved solver");
  }
  if (!crypto::verify_signature(
          schema::bytes_view_t{intent_id.data(), intent_id.size()},
          *config_.claim_signer, signature)) {
    return reject(schema::error_code_t::invalid_signature,
                  "claim signature does not verify");
  }
  return release(ctx, *record, ctx.caller);
}

schema::operation_result_t inflow_escrow::release(
    execution::context& ctx,
    schema::escrow_state_t& record,
    const schema::address_t& solver) {
  auto paid = execution::transfer(ctx, record.token_addr, config_.address,
                                  solver, record.amount);
  if (!paid.ok()) {
    return paid;
  }
  auto amount = record.amount;
  record.amount = 0;
  record.status = schema::escrow_status_t::released;
  record.released_to = solver;
  ctx.state.put(schema::key::make_escrow_key(record.intent_id), record);
  ctx.emit("escrow_released",
           {execution::make_attribute("intent_id", record.intent_id, true),
            execution::make_attribute("solver", solver, true),
            execution::make_attribute("amount", amount)});
  spdlog::info("escrow for intent {} released to {} amount {}",
               schema::to_hex(record.intent_id), schema::to_hex(solver),
               amount);
  return {};
}

schema::operation_result_t inflow_escrow::cancel(
    execution::context& ctx,
    const schema::intent_id_t& intent_id) {
  auto record = escrow(ctx, intent_id);
  if (!record) {
    return reject(schema::error_code_t::does_not_exist, "no escrow for intent");
  }
  if (ctx.caller != record->requester_addr) {
    return reject(schema::error_code_t::unauthorized_requester,
                  "only the requester can cancel");
  }
  if (record->status != schema::escrow_status_t::open) {
    return reject_closed(*record);
  }
  if (ctx.now <= record->expiry) {
    return reject(schema::error_code_t::not_expired_yet,
                  fmt::format("escrow expires at {}", record->expiry));
  }
  auto refunded = execution::transfer(ctx, record->token_addr, config_.address,
                                      record->requester_addr, record->amount);
  if (!refunded.ok()) {
    return refunded;
  }
  auto amount = record->amount;
  record->amount = 0;
  record->status = schema::escrow_status_t::cancelled;
  ctx.state.put(schema::key::make_escrow_key(intent_id), *record);
  ctx.emit("escrow_cancelled",
           {execution::make_attribute("intent_id", intent_id, true),
            execution::make_attribute("requester", record->requester_addr),
            execution::make_attribute("amount", amount)});
  spdlog::info("escrow for intent {} cancelled, refunded {}",
               schema::to_hex(intent_id), amount);
  return {};
}

std::optional<schema::escrow_state_t> inflow_escrow::escrow(
    execution::context& ctx,
    const schema::intent_id_t& intent_id) const {
  return ctx.state.get<schema::escrow_state_t>(
      schema::key::make_escrow_key(intent_id));
}

std::optional<schema::requirements_state_t> inflow_escrow::requirements(
    execution::context& ctx,
    const schema::intent_id_t& intent_id) const {
  return ctx.state.get<schema::requirements_state_t>(
      schema::key::make_escrow_requirements_key(intent_id));
}

}  // namespace ferry::escrow
