#pragma once

#include <ferry/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace ferry::schema {

enum class error_code_t : uint32_t {
  ok = 0,

  // message codec
  empty_payload = 1,
  invalid_length = 2,
  unknown_message_type = 3,
  invalid_payload = 4,

  // endpoint
  unauthorized_relay = 10,
  no_remote_endpoint = 11,
  unregistered_remote_endpoint = 12,
  already_delivered = 13,
  handler_not_configured = 14,
  unauthorized_sender = 15,
  unauthorized_admin = 16,
  relay_already_exists = 17,
  relay_not_found = 18,
  invalid_address = 19,
  unsupported_message = 20,
  wrong_destination_chain = 21,

  // escrow and requirements
  already_exists = 30,
  zero_amount = 31,
  does_not_exist = 32,
  already_released = 33,
  already_fulfilled = 34,
  already_cancelled = 35,
  not_expired_yet = 36,
  expired = 37,
  unauthorized_solver = 38,
  token_mismatch = 39,
  unauthorized_requester = 40,
  amount_mismatch = 41,
  requirements_not_found = 42,
  escrow_already_created = 43,
  invalid_signature = 44,
  release_path_disabled = 45,
  escrow_not_confirmed = 46,
  invalid_intent = 47,
  invalid_solver = 48,

  // tokens
  insufficient_balance = 50,
  amount_overflow = 51,

  // node and transport
  unsupported_operation = 60,
  transport_failure = 61,
};

inline constexpr auto kErrorCodeMappings = std::array{
    enum_mapping_t<error_code_t>{"ok", error_code_t::ok},
    enum_mapping_t<error_code_t>{"empty_payload", error_code_t::empty_payload},
    enum_mapping_t<error_code_t>{"invalid_length",
                                 error_code_t::invalid_length},
    enum_mapping_t<error_code_t>{"unknown_message_type",
                                 error_code_t::unknown_message_type},
    enum_mapping_t<error_code_t>{"invalid_payload",
                                 error_code_t::invalid_payload},
    enum_mapping_t<error_code_t>{"unauthorized_relay",
                                 error_code_t::unauthorized_relay},
    enum_mapping_t<error_code_t>{"no_remote_endpoint",
                                 error_code_t::no_remote_endpoint},
    enum_mapping_t<error_code_t>{"unregistered_remote_endpoint",
                                 error_code_t::unregistered_remote_endpoint},
    enum_mapping_t<error_code_t>{"already_delivered",
                                 error_code_t::already_delivered},
    enum_mapping_t<error_code_t>{"handler_not_configured",
                                 error_code_t::handler_not_configured},
    enum_mapping_t<error_code_t>{"unauthorized_sender",
                                 error_code_t::unauthorized_sender},
    enum_mapping_t<error_code_t>{"unauthorized_admin",
                                 error_code_t::unauthorized_admin},
    enum_mapping_t<error_code_t>{"relay_already_exists",
                                 error_code_t::relay_already_exists},
    enum_mapping_t<error_code_t>{"relay_not_found",
                                 error_code_t::relay_not_found},
    enum_mapping_t<error_code_t>{"invalid_address",
                                 error_code_t::invalid_address},
    enum_mapping_t<error_code_t>{"unsupported_message",
                                 error_code_t::unsupported_message},
    enum_mapping_t<error_code_t>{"wrong_destination_chain",
                                 error_code_t::wrong_destination_chain},
    enum_mapping_t<error_code_t>{"already_exists",
                                 error_code_t::already_exists},
    enum_mapping_t<error_code_t>{"zero_amount", error_code_t::zero_amount},
    enum_mapping_t<error_code_t>{"does_not_exist",
                                 error_code_t::does_not_exist},
    enum_mapping_t<error_code_t>{"already_released",
                                 error_code_t::already_released},
    enum_mapping_t<error_code_t>{"already_fulfilled",
                                 error_code_t::already_fulfilled},
    enum_mapping_t<error_code_t>{"already_cancelled",
                                 error_code_t::already_cancelled},
    enum_mapping_t<error_code_t>{"not_expired_yet",
                                 error_code_t::not_expired_yet},
    enum_mapping_t<error_code_t>{"expired", error_code_t::expired},
    enum_mapping_t<error_code_t>{"unauthorized_solver",
                                 error_code_t::unauthorized_solver},
    enum_mapping_t<error_code_t>{"token_mismatch",
                                 error_code_t::token_mismatch},
    enum_mapping_t<error_code_t>{"unauthorized_requester",
                                 error_code_t::unauthorized_requester},
    enum_mapping_t<error_code_t>{"amount_mismatch",
                                 error_code_t::amount_mismatch},
    enum_mapping_t<error_code_t>{"requirements_not_found",
                                 error_code_t::requirements_not_found},
    enum_mapping_t<error_code_t>{"escrow_already_created",
                                 error_code_t::escrow_already_created},
    enum_mapping_t<error_code_t>{"invalid_signature",
                                 error_code_t::invalid_signature},
    enum_mapping_t<error_code_t>{"release_path_disabled",
                                 error_code_t::release_path_disabled},
    enum_mapping_t<error_code_t>{"escrow_not_confirmed",
                                 error_code_t::escrow_not_confirmed},
    enum_mapping_t<error_code_t>{"invalid_intent",
                                 error_code_t::invalid_intent},
    enum_mapping_t<error_code_t>{"invalid_solver",
                                 error_code_t::invalid_solver},
    enum_mapping_t<error_code_t>{"insufficient_balance",
                                 error_code_t::insufficient_balance},
    enum_mapping_t<error_code_t>{"amount_overflow",
                                 error_code_t::amount_overflow},
    enum_mapping_t<error_code_t>{"unsupported_operation",
                                 error_code_t::unsupported_operation},
    enum_mapping_t<error_code_t>{"transport_failure",
                                 error_code_t::transport_failure}};

inline constexpr std::string_view to_string(const error_code_t value) {
  return to_string(value, kErrorCodeMappings).value_or("unknown");
}

/// Rejections that mean the work was already done. A relay treats these as
/// success.
inline constexpr bool is_terminal(const error_code_t value) {
  switch (value) {
    case error_code_t::already_delivered:
    case error_code_t::already_released:
    case error_code_t::already_fulfilled:
    case error_code_t::already_cancelled:
      return true;
    default:
      return false;
  }
}

}  // namespace ferry::schema
