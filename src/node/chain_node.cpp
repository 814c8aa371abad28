#include <ferry/execution/token_book.hpp>
#include <ferry/node/chain_node.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <utility>

namespace ferry::node {

namespace {

schema::operation_result_t unsupported(const std::string_view module) {
  return schema::make_error_result(
      schema::error_code_t::unsupported_operation, schema::kCodespaceNode,
      std::string{module} + " is not hosted on this chain");
}

}  // namespace

schema::timestamp_seconds_t system_seconds() {
  return static_cast<schema::timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

template <typename Fn>
schema::operation_result_t chain_node::execute(const schema::address_t& caller,
                                               const std::string_view operation,
                                               Fn&& fn) {
  auto lock = std::scoped_lock{mutex_};
  auto state = execution::write_set{encoder_, storage_};
  auto ctx = execution::context{.state = state,
                                .chain_id = config_.chain_id,
                                .now = now_(),
                                .caller = caller};
  auto result = std::forward<Fn>(fn)(ctx);
  if (!result.ok()) {
    spdlog::warn("chain {} {} rejected: {} [{}] {}", config_.chain_id,
                 operation, schema::to_string(result.code), result.codespace,
                 result.log);
    result.events.clear();
    return result;
  }
  state.commit();
  result.events = std::move(ctx.events);
  return result;
}

template <typename Fn>
auto chain_node::query(Fn&& fn) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = execution::write_set{encoder_, storage_};
  auto ctx = execution::context{.state = state,
                                .chain_id = config_.chain_id,
                                .now = now_(),
                                .caller = schema::address_t{}};
  return std::forward<Fn>(fn)(ctx);
}

chain_node::chain_node(chain_config config,
                       const storage::rocksdb_storage_t& storage,
                       time_source_t now)
    : config_{std::move(config)},
      storage_{storage},
      now_{std::move(now)},
      endpoint_{config_.admin} {
  if (!now_) {
    now_ = system_seconds;
  }
  if (config_.role == chain_role_t::connected) {
    escrow_ = std::make_unique<escrow::inflow_escrow>(config_.escrow, endpoint_);
    outflow_ =
        std::make_unique<outflow::outflow_validator>(config_.outflow, endpoint_);
    endpoint_.register_handler(*escrow_);
    endpoint_.register_handler(*outflow_);
  } else {
    hub_ = std::make_unique<hub::hub_intents>(config_.hub, endpoint_);
    endpoint_.register_handler(*hub_);
  }

  auto result = execute(config_.admin, "initialize", [&](auto& ctx) {
    endpoint_.initialize(ctx);
    install_default_routes(ctx);
    return schema::operation_result_t{};
  });
  if (!result.ok()) {
    ferry::common::critical("failed to initialize chain state");
  }
  spdlog::info("chain {} ready as {} node", config_.chain_id,
               to_string(config_.role));
}

void chain_node::install_default_routes(execution::context& ctx) {
  auto bind = [&](const schema::message_type_t type,
                  std::vector<schema::address_t> handlers) {
    if (endpoint_.handlers(ctx, type)) {
      return;
    }
    auto result = endpoint_.set_handlers(ctx, type, std::move(handlers));
    if (!result.ok()) {
      ferry::common::critical("failed to install default route: " +
                              result.log);
    }
  };

  if (config_.role == chain_role_t::hub) {
    bind(schema::message_type_t::escrow_confirmation, {hub_->address()});
    bind(schema::message_type_t::fulfillment_proof, {hub_->address()});
    return;
  }
  bind(schema::message_type_t::intent_requirements,
       {escrow_->address(), outflow_->address()});
  if (config_.escrow.release_mode == escrow::release_mode_t::gmp) {
    bind(schema::message_type_t::fulfillment_proof, {escrow_->address()});
  }
}

schema::operation_result_t chain_node::deliver(
    const schema::address_t& relay,
    const schema::chain_id_t src_chain_id,
    const schema::address_t& src_addr,
    const schema::bytes_view_t& payload) {
  return execute(relay, "deliver", [&](auto& ctx) {
    return endpoint_.deliver(ctx, src_chain_id, src_addr, payload);
  });
}

std::vector<schema::outbound_message_t> chain_node::list_outbound(
    const schema::nonce_t after,
    const std::size_t limit) const {
  return query(
      [&](auto& ctx) { return endpoint_.list_outbound(ctx, after, limit); });
}

schema::nonce_t chain_node::next_nonce() const {
  return query([&](auto& ctx) { return endpoint_.next_nonce(ctx); });
}

bool chain_node::is_delivered(const schema::intent_id_t& intent_id,
                              const schema::message_type_t type) const {
  return query(
      [&](auto& ctx) { return endpoint_.is_delivered(ctx, intent_id, type); });
}

schema::operation_result_t chain_node::add_relay(
    const schema::address_t& caller,
    const schema::address_t& relay) {
  return execute(caller, "add_relay",
                 [&](auto& ctx) { return endpoint_.add_relay(ctx, relay); });
}

schema::operation_result_t chain_node::remove_relay(
    const schema::address_t& caller,
    const schema::address_t& relay) {
  return execute(caller, "remove_relay",
                 [&](auto& ctx) { return endpoint_.remove_relay(ctx, relay); });
}

bool chain_node::is_relay_authorized(const schema::address_t& relay) const {
  return query(
      [&](auto& ctx) { return endpoint_.is_relay_authorized(ctx, relay); });
}

schema::operation_result_t chain_node::set_remote_endpoint(
    const schema::address_t& caller,
    const schema::chain_id_t chain_id,
    const schema::address_t& address) {
  return execute(caller, "set_remote_endpoint", [&](auto& ctx) {
    return endpoint_.set_remote_endpoint(ctx, chain_id, address);
  });
}

schema::operation_result_t chain_node::add_remote_endpoint(
    const schema::address_t& caller,
    const schema::chain_id_t chain_id,
    const schema::address_t& address) {
  return execute(caller, "add_remote_endpoint", [&](auto& ctx) {
    return endpoint_.add_remote_endpoint(ctx, chain_id, address);
  });
}

bool chain_node::has_remote_endpoint(const schema::chain_id_t chain_id) const {
  return query(
      [&](auto& ctx) { return endpoint_.has_remote_endpoint(ctx, chain_id); });
}

schema::operation_result_t chain_node::set_handlers(
    const schema::address_t& caller,
    const schema::message_type_t type,
    std::vector<schema::address_t> handlers) {
  return execute(caller, "set_handlers", [&](auto& ctx) {
    return endpoint_.set_handlers(ctx, type, std::move(handlers));
  });
}

schema::operation_result_t chain_node::mint(const schema::address_t& caller,
                                            const schema::address_t& token,
                                            const schema::address_t& account,
                                            const schema::amount_t amount) {
  return execute(caller, "mint", [&](auto& ctx) {
    if (ctx.caller != config_.admin) {
      return schema::make_error_result(schema::error_code_t::unauthorized_admin,
                                       schema::kCodespaceToken,
                                       "only the admin mints");
    }
    return execution::mint(ctx, token, account, amount);
  });
}

schema::amount_t chain_node::balance_of(
    const schema::address_t& token,
    const schema::address_t& account) const {
  return query([&](auto& ctx) {
    return execution::balance_of(ctx, token, account);
  });
}

schema::operation_result_t chain_node::create_escrow(
    const schema::address_t& caller,
    const schema::intent_id_t& intent_id,
    const schema::amount_t amount,
    const schema::address_t& token,
    const schema::address_t& solver,
    const std::optional<schema::duration_seconds_t> expiry_duration) {
  if (!escrow_) {
    return unsupported("escrow");
  }
  return execute(caller, "create_escrow", [&](auto& ctx) {
    return escrow_->create(ctx, intent_id, amount, token, solver,
                           expiry_duration);
  });
}

schema::operation_result_t chain_node::cancel_escrow(
    const schema::address_t& caller,
    const schema::intent_id_t& intent_id) {
  if (!escrow_) {
    return unsupported("escrow");
  }
  return execute(caller, "cancel_escrow",
                 [&](auto& ctx) { return escrow_->cancel(ctx, intent_id); });
}

schema::operation_result_t chain_node::claim_escrow(
    const schema::address_t& caller,
    const schema::intent_id_t& intent_id,
    const schema::signature_t& signature) {
  if (!escrow_) {
    return unsupported("escrow");
  }
  return execute(caller, "claim_escrow", [&](auto& ctx) {
    return escrow_->claim(ctx, intent_id, signature);
  });
}

std::optional<schema::escrow_state_t> chain_node::escrow(
    const schema::intent_id_t& intent_id) const {
  if (!escrow_) {
    return std::nullopt;
  }
  return query([&](auto& ctx) { return escrow_->escrow(ctx, intent_id); });
}

std::optional<schema::requirements_state_t> chain_node::escrow_requirements(
    const schema::intent_id_t& intent_id) const {
  if (!escrow_) {
    return std::nullopt;
  }
  return query(
      [&](auto& ctx) { return escrow_->requirements(ctx, intent_id); });
}

schema::operation_result_t chain_node::fulfill_intent(
    const schema::address_t& caller,
    const schema::intent_id_t& intent_id,
    const schema::address_t& token) {
  if (!outflow_) {
    return unsupported("outflow validator");
  }
  return execute(caller, "fulfill_intent", [&](auto& ctx) {
    return outflow_->fulfill_intent(ctx, intent_id, token);
  });
}

std::optional<schema::requirements_state_t> chain_node::outflow_requirements(
    const schema::intent_id_t& intent_id) const {
  if (!outflow_) {
    return std::nullopt;
  }
  return query(
      [&](auto& ctx) { return outflow_->requirements(ctx, intent_id); });
}

schema::operation_result_t chain_node::create_outflow_intent(
    const schema::address_t& caller,
    const hub::hub_intent_params& params) {
  if (!hub_) {
    return unsupported("hub");
  }
  return execute(caller, "create_outflow_intent", [&](auto& ctx) {
    return hub_->create_outflow_intent(ctx, params);
  });
}

schema::operation_result_t chain_node::create_inflow_intent(
    const schema::address_t& caller,
    const hub::hub_intent_params& params) {
  if (!hub_) {
    return unsupported("hub");
  }
  return execute(caller, "create_inflow_intent", [&](auto& ctx) {
    return hub_->create_inflow_intent(ctx, params);
  });
}

schema::operation_result_t chain_node::fulfill_inflow_intent(
    const schema::address_t& caller,
    const schema::intent_id_t& intent_id) {
  if (!hub_) {
    return unsupported("hub");
  }
  return execute(caller, "fulfill_inflow_intent", [&](auto& ctx) {
    return hub_->fulfill_inflow_intent(ctx, intent_id);
  });
}

schema::operation_result_t chain_node::cancel_intent(
    const schema::address_t& caller,
    const schema::intent_id_t& intent_id) {
  if (!hub_) {
    return unsupported("hub");
  }
  return execute(caller, "cancel_intent", [&](auto& ctx) {
    return hub_->cancel_intent(ctx, intent_id);
  });
}

std::optional<schema::hub_intent_state_t> chain_node::hub_intent(
    const schema::intent_id_t& intent_id) const {
  if (!hub_) {
    return std::nullopt;
  }
  return query([&](auto& ctx) { return hub_->intent(ctx, intent_id); });
}

}  // namespace ferry::node
