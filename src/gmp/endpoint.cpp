#include <ferry/codec/message_codec.hpp>
#include <ferry/gmp/endpoint.hpp>
#include <ferry/schema/key/ledger_keys.hpp>

#include <boost/endian/conversion.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

namespace ferry::gmp {

namespace {

schema::operation_result_t reject(const schema::error_code_t code,
                                  std::string log) {
  spdlog::debug("endpoint rejected: {} ({})", schema::to_string(code), log);
  return schema::make_error_result(code, schema::kCodespaceEndpoint,
                                   std::move(log));
}

bool contains(const std::vector<schema::address_t>& addresses,
              const schema::address_t& address) {
  return std::find(std::begin(addresses), std::end(addresses), address) !=
         std::end(addresses);
}

}  // namespace

endpoint::endpoint(schema::address_t admin) : admin_{admin} {}

void endpoint::register_handler(message_handler& handler) {
  handlers_[handler.address()] = &handler;
}

bool endpoint::is_local_handler(const schema::address_t& address) const {
  return handlers_.contains(address);
}

bool endpoint::is_admin(const execution::context& ctx) const {
  return ctx.caller == admin_;
}

void endpoint::initialize(execution::context& ctx) {
  auto initialized_key = schema::key::make_prefix(schema::key::kInitializedKey);
  if (ctx.state.contains(initialized_key)) {
    return;
  }
  ctx.state.put(schema::key::make_relay_key(admin_), true);
  ctx.state.put(schema::key::make_prefix(schema::key::kNextNonceKey),
                schema::nonce_t{1});
  ctx.state.put(initialized_key, true);
  spdlog::info("endpoint initialized on chain {} with admin {}", ctx.chain_id,
               schema::to_hex(admin_));
}

schema::operation_result_t endpoint::add_relay(
    execution::context& ctx,
    const schema::address_t& relay) {
  if (!is_admin(ctx)) {
    return reject(schema::error_code_t::unauthorized_admin,
                  "only the admin manages relays");
  }
  if (is_relay_authorized(ctx, relay)) {
    return reject(schema::error_code_t::relay_already_exists,
                  "relay already authorized");
  }
  ctx.state.put(schema::key::make_relay_key(relay), true);
  ctx.emit("relay_added",
           {execution::make_attribute("relay", relay, true)});
  spdlog::info("relay {} added on chain {}", schema::to_hex(relay),
               ctx.chain_id);
  return {};
}

schema::operation_result_t endpoint::remove_relay(
    execution::context& ctx,
    const schema::address_t& relay) {
  if (!is_admin(ctx)) {
    return reject(schema::error_code_t::unauthorized_admin,
                  "only the admin manages relays");
  }
  if (!is_relay_authorized(ctx, relay)) {
    return reject(schema::error_code_t::relay_not_found,
                  "relay not authorized");
  }
  ctx.state.put(schema::key::make_relay_key(relay), false);
  ctx.emit("relay_removed",
           {execution::make_attribute("relay", relay, true)});
  spdlog::info("relay {} removed on chain {}", schema::to_hex(relay),
               ctx.chain_id);
  return {};
}

bool endpoint::is_relay_authorized(execution::context& ctx,
                                   const schema::address_t& relay) const {
  return ctx.state.get<bool>(schema::key::make_relay_key(relay))
      .value_or(false);
}

schema::operation_result_t endpoint::set_remote_endpoint(
    execution::context& ctx,
    const schema::chain_id_t chain_id,
    const schema::address_t& address) {
  if (!is_admin(ctx)) {
    return reject(schema::error_code_t::unauthorized_admin,
                  "only the admin manages remote endpoints");
  }
  if (schema::is_zero(address)) {
    return reject(schema::error_code_t::invalid_address,
                  "remote endpoint address is zero");
  }
  ctx.state.put(schema::key::make_remote_key(chain_id),
                schema::remote_endpoints_t{.addresses = {address}});
  ctx.emit("remote_endpoint_set",
           {execution::make_attribute("chain_id", chain_id),
            execution::make_attribute("address", address)});
  return {};
}

schema::operation_result_t endpoint::add_remote_endpoint(
    execution::context& ctx,
    const schema::chain_id_t chain_id,
    const schema::address_t& address) {
  if (!is_admin(ctx)) {
    return reject(schema::error_code_t::unauthorized_admin,
                  "only the admin manages remote endpoints");
  }
  if (schema::is_zero(address)) {
    return reject(schema::error_code_t::invalid_address,
                  "remote endpoint address is zero");
  }
  auto remotes = schema::remote_endpoints_t{
      .addresses = remote_endpoints(ctx, chain_id)};
  if (!contains(remotes.addresses, address)) {
    remotes.addresses.push_back(address);
  }
  ctx.state.put(schema::key::make_remote_key(chain_id), remotes);
  ctx.emit("remote_endpoint_added",
           {execution::make_attribute("chain_id", chain_id),
            execution::make_attribute("address", address)});
  return {};
}

std::vector<schema::address_t> endpoint::remote_endpoints(
    execution::context& ctx,
    const schema::chain_id_t chain_id) const {
  auto remotes = ctx.state.get<schema::remote_endpoints_t>(
      schema::key::make_remote_key(chain_id));
  if (!remotes) {
    return {};
  }
  return remotes->addresses;
}

bool endpoint::has_remote_endpoint(execution::context& ctx,
                                   const schema::chain_id_t chain_id) const {
  return !remote_endpoints(ctx, chain_id).empty();
}

schema::operation_result_t endpoint::set_handlers(
    execution::context& ctx,
    const schema::message_type_t type,
    std::vector<schema::address_t> handlers) {
  if (!is_admin(ctx)) {
    return reject(schema::error_code_t::unauthorized_admin,
                  "only the admin manages routes");
  }
  for (const auto& handler : handlers) {
    if (!is_local_handler(handler)) {
      return reject(schema::error_code_t::handler_not_configured,
                    fmt::format("{} is not a local handler",
                                schema::to_hex(handler)));
    }
  }
  auto count = handlers.size();
  ctx.state.put(schema::key::make_route_key(type),
                schema::handler_binding_t{.handlers = std::move(handlers)});
  ctx.emit("route_set",
           {execution::make_attribute("msg_type",
                                      std::string{schema::to_string(type)}),
            execution::make_attribute("handlers", count)});
  return {};
}

std::optional<schema::handler_binding_t> endpoint::handlers(
    execution::context& ctx,
    const schema::message_type_t type) const {
  return ctx.state.get<schema::handler_binding_t>(
      schema::key::make_route_key(type));
}

schema::operation_result_t endpoint::deliver(
    execution::context& ctx,
    const schema::chain_id_t src_chain_id,
    const schema::address_t& src_addr,
    const schema::bytes_view_t& payload) {
  if (!is_relay_authorized(ctx, ctx.caller)) {
    return reject(schema::error_code_t::unauthorized_relay,
                  fmt::format("{} is not an authorized relay",
                              schema::to_hex(ctx.caller)));
  }

  auto remotes = remote_endpoints(ctx, src_chain_id);
  if (remotes.empty()) {
    return reject(schema::error_code_t::no_remote_endpoint,
                  fmt::format("no remote endpoint for chain {}", src_chain_id));
  }
  if (!contains(remotes, src_addr)) {
    return reject(schema::error_code_t::unregistered_remote_endpoint,
                  fmt::format("{} is not registered for chain {}",
                              schema::to_hex(src_addr), src_chain_id));
  }

  auto error = schema::error_code_t::ok;
  auto prefix = codec::peek_prefix(payload, error);
  if (!prefix) {
    return reject(error, "payload is not a GMP message");
  }
  const auto& [type, intent_id] = *prefix;

  auto delivered_key = schema::key::make_delivered_key(
      schema::key::make_delivery_id(intent_id, type));
  if (ctx.state.contains(delivered_key)) {
    return reject(schema::error_code_t::already_delivered,
                  fmt::format("{} for intent {} already delivered",
                              schema::to_string(type),
                              schema::to_hex(intent_id)));
  }

  auto message = codec::try_decode(payload, error);
  if (!message) {
    return reject(error, "malformed GMP payload");
  }

  auto binding = handlers(ctx, type);
  if (!binding) {
    return reject(schema::error_code_t::handler_not_configured,
                  fmt::format("no route for {}", schema::to_string(type)));
  }

  ctx.state.put(delivered_key, true);

  for (const auto& address : binding->handlers) {
    auto it = handlers_.find(address);
    if (it == std::end(handlers_)) {
      return reject(schema::error_code_t::handler_not_configured,
                    fmt::format("route names unknown handler {}",
                                schema::to_hex(address)));
    }
    auto result = it->second->on_message(ctx, src_chain_id, src_addr, *message);
    if (!result.ok()) {
      return result;
    }
  }

  ctx.emit("message_delivered",
           {execution::make_attribute("src_chain_id", src_chain_id),
            execution::make_attribute("src_addr", src_addr),
            execution::make_attribute("msg_type",
                                      std::string{schema::to_string(type)}),
            execution::make_attribute("intent_id", intent_id, true),
            execution::make_attribute("handlers", binding->handlers.size())});
  spdlog::debug("delivered {} for intent {} from chain {}",
                schema::to_string(type), schema::to_hex(intent_id),
                src_chain_id);
  return {};
}

schema::operation_result_t endpoint::send(execution::context& ctx,
                                          const schema::address_t& sender,
                                          const schema::chain_id_t dst_chain_id,
                                          const schema::address_t& dst_addr,
                                          const schema::bytes_view_t& payload) {
  if (!is_local_handler(sender)) {
    return reject(schema::error_code_t::unauthorized_sender,
                  "only handlers can send");
  }

  auto nonce = next_nonce(ctx);
  if (nonce == std::numeric_limits<schema::nonce_t>::max()) {
    ferry::common::critical("outbound nonce space exhausted");
  }
  auto entry = schema::outbound_message_t{.nonce = nonce,
                                          .src_addr = sender,
                                          .dst_chain_id = dst_chain_id,
                                          .dst_addr = dst_addr,
                                          .payload = schema::make_bytes(payload)};
  ctx.state.put(schema::key::make_outbox_key(nonce), entry);
  ctx.state.put(schema::key::make_prefix(schema::key::kNextNonceKey),
                nonce + 1);

  ctx.emit("message_sent",
           {execution::make_attribute("src_chain_id", ctx.chain_id),
            execution::make_attribute("dst_chain_id", dst_chain_id),
            execution::make_attribute("src_addr", sender),
            execution::make_attribute("dst_addr", dst_addr),
            execution::make_attribute("nonce", nonce),
            execution::make_attribute("payload", schema::to_hex(payload))});

  auto result = schema::operation_result_t{};
  result.data.resize(sizeof(schema::nonce_t));
  boost::endian::store_big_u64(result.data.data(), nonce);
  return result;
}

std::vector<schema::outbound_message_t> endpoint::list_outbound(
    execution::context& ctx,
    const schema::nonce_t after,
    const std::size_t limit) const {
  auto messages = std::vector<schema::outbound_message_t>{};
  if (after == std::numeric_limits<schema::nonce_t>::max() || limit == 0) {
    return messages;
  }
  auto entries = ctx.state.list_from(
      schema::key::make_prefix(schema::key::kOutboxPrefix),
      schema::key::make_outbox_key(after + 1), limit);
  messages.reserve(entries.size());
  for (const auto& [key, value] : entries) {
    messages.push_back(ctx.state.encoder().decode<schema::outbound_message_t>(
        schema::make_bytes_view(value)));
  }
  return messages;
}

schema::nonce_t endpoint::next_nonce(execution::context& ctx) const {
  return ctx.state
      .get<schema::nonce_t>(schema::key::make_prefix(schema::key::kNextNonceKey))
      .value_or(1);
}

bool endpoint::is_delivered(execution::context& ctx,
                            const schema::intent_id_t& intent_id,
                            const schema::message_type_t type) const {
  return ctx.state.contains(schema::key::make_delivered_key(
      schema::key::make_delivery_id(intent_id, type)));
}

std::optional<schema::nonce_t> sent_nonce(
    const schema::operation_result_t& result) {
  if (!result.ok() || result.data.size() != sizeof(schema::nonce_t)) {
    return std::nullopt;
  }
  return boost::endian::load_big_u64(result.data.data());
}

}  // namespace ferry::gmp
