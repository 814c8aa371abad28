#pragma once
#include <ferry/schema/message_type.hpp>
#include <ferry/schema/primitives.hpp>

#include <string_view>

// Every persisted record lives under one of these prefixes.
namespace ferry::schema::key {

inline constexpr auto kRelayPrefix = std::string_view{"FERRY|CFG|RELAY|"};
inline constexpr auto kRemotePrefix = std::string_view{"FERRY|CFG|REMOTE|"};
inline constexpr auto kRoutePrefix = std::string_view{"FERRY|CFG|ROUTE|"};
inline constexpr auto kInitializedKey = std::string_view{"FERRY|CFG|INIT"};
inline constexpr auto kDeliveredPrefix =
    std::string_view{"FERRY|GMP|DELIVERED|"};
inline constexpr auto kOutboxPrefix = std::string_view{"FERRY|GMP|OUTBOX|"};
inline constexpr auto kNextNonceKey = std::string_view{"FERRY|GMP|NEXT_NONCE"};
inline constexpr auto kEscrowPrefix = std::string_view{"FERRY|ESCROW|RECORD|"};
inline constexpr auto kEscrowRequirementsPrefix =
    std::string_view{"FERRY|ESCROW|REQUIREMENTS|"};
inline constexpr auto kOutflowRequirementsPrefix =
    std::string_view{"FERRY|OUTFLOW|REQUIREMENTS|"};
inline constexpr auto kHubIntentPrefix = std::string_view{"FERRY|HUB|INTENT|"};
inline constexpr auto kBalancePrefix = std::string_view{"FERRY|TOKEN|BALANCE|"};
inline constexpr auto kRelayCursorPrefix =
    std::string_view{"FERRY|RELAY|CURSOR|"};

/// Dedupe key of a delivered message: blake3(intent_id || type tag).
hash32_t make_delivery_id(const intent_id_t& intent_id, message_type_t type);

/// Escrow id: blake3("escrow" || chain_id || intent_id).
escrow_id_t make_escrow_id(chain_id_t chain_id, const intent_id_t& intent_id);

bytes_t make_relay_key(const address_t& relay);
bytes_t make_remote_key(chain_id_t chain_id);
bytes_t make_route_key(message_type_t type);
bytes_t make_delivered_key(const hash32_t& delivery_id);
bytes_t make_outbox_key(nonce_t nonce);
bytes_t make_escrow_key(const intent_id_t& intent_id);
bytes_t make_escrow_requirements_key(const intent_id_t& intent_id);
bytes_t make_outflow_requirements_key(const intent_id_t& intent_id);
bytes_t make_hub_intent_key(const intent_id_t& intent_id);
bytes_t make_balance_key(const address_t& token, const address_t& account);
bytes_t make_relay_cursor_key(chain_id_t src_chain_id, chain_id_t dst_chain_id);

bytes_t make_prefix(std::string_view prefix);

}  // namespace ferry::schema::key
