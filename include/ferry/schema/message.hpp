#pragma once
#include <ferry/schema/escrow_confirmation.hpp>
#include <ferry/schema/fulfillment_proof.hpp>
#include <ferry/schema/intent_requirements.hpp>
#include <ferry/schema/message_type.hpp>

#include <variant>

namespace ferry::schema {

using message_t = std::variant<intent_requirements_t,
                               escrow_confirmation_t,
                               fulfillment_proof_t>;

inline message_type_t type_of(const message_t& message) {
  return std::visit(
      overloaded{[](const intent_requirements_t&) {
                   return message_type_t::intent_requirements;
                 },
                 [](const escrow_confirmation_t&) {
                   return message_type_t::escrow_confirmation;
                 },
                 [](const fulfillment_proof_t&) {
                   return message_type_t::fulfillment_proof;
                 }},
      message);
}

inline const intent_id_t& intent_id_of(const message_t& message) {
  return std::visit(
      [](const auto& body) -> const intent_id_t& { return body.intent_id; },
      message);
}

}  // namespace ferry::schema
