#include <ferry/schema/key/builder.hpp>
#include <ferry/schema/key/ledger_keys.hpp>

namespace ferry::schema::key {

namespace {

bytes_t hash_key(const std::string_view prefix, const hash32_t& id) {
  auto b = builder{};
  b.write(prefix);
  b.write(id);
  return b.data;
}

}  // namespace

hash32_t make_delivery_id(const intent_id_t& intent_id,
                          const message_type_t type) {
  auto b = builder{};
  b.write(intent_id);
  b.write(static_cast<uint8_t>(type));
  return b.hash();
}

escrow_id_t make_escrow_id(const chain_id_t chain_id,
                           const intent_id_t& intent_id) {
  auto b = builder{};
  b.write("escrow");
  b.write(chain_id);
  b.write(intent_id);
  return b.hash();
}

bytes_t make_relay_key(const address_t& relay) {
  return hash_key(kRelayPrefix, relay);
}

bytes_t make_remote_key(const chain_id_t chain_id) {
  auto b = builder{};
  b.write(kRemotePrefix);
  b.write(chain_id);
  return b.data;
}

bytes_t make_route_key(const message_type_t type) {
  auto b = builder{};
  b.write(kRoutePrefix);
  b.write(static_cast<uint8_t>(type));
  return b.data;
}

bytes_t make_delivered_key(const hash32_t& delivery_id) {
  return hash_key(kDeliveredPrefix, delivery_id);
}

bytes_t make_outbox_key(const nonce_t nonce) {
  auto b = builder{};
  b.write(kOutboxPrefix);
  b.write(nonce);
  return b.data;
}

bytes_t make_escrow_key(const intent_id_t& intent_id) {
  return hash_key(kEscrowPrefix, intent_id);
}

bytes_t make_escrow_requirements_key(const intent_id_t& intent_id) {
  return hash_key(kEscrowRequirementsPrefix, intent_id);
}

bytes_t make_outflow_requirements_key(const intent_id_t& intent_id) {
  return hash_key(kOutflowRequirementsPrefix, intent_id);
}

bytes_t make_hub_intent_key(const intent_id_t& intent_id) {
  return hash_key(kHubIntentPrefix, intent_id);
}

bytes_t make_balance_key(const address_t& token, const address_t& account) {
  auto b = builder{};
  b.write(kBalancePrefix);
  b.write(token);
  b.write(account);
  return b.data;
}

bytes_t make_relay_cursor_key(const chain_id_t src_chain_id,
                              const chain_id_t dst_chain_id) {
  auto b = builder{};
  b.write(kRelayCursorPrefix);
  b.write(src_chain_id);
  b.write(dst_chain_id);
  return b.data;
}

bytes_t make_prefix(const std::string_view prefix) {
  return builder{}.write(prefix).data;
}

}  // namespace ferry::schema::key
