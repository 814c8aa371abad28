#pragma once
#include <ferry/schema/operation_result.hpp>
#include <ferry/schema/outbound_message.hpp>
#include <ferry/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace ferry::relay {

/// The relay's view of one chain: read its mailbox, deliver into its endpoint.
class chain_client {
 public:
  virtual ~chain_client() = default;

  virtual schema::chain_id_t chain_id() const = 0;

  /// Mailbox entries with nonce > `after`. nullopt when the chain cannot be
  /// reached.
  virtual std::optional<std::vector<schema::outbound_message_t>> list_outbound(
      schema::nonce_t after,
      std::size_t limit) = 0;

  /// Transport failures come back as transport_failure.
  virtual schema::operation_result_t deliver(
      schema::chain_id_t src_chain_id,
      const schema::address_t& src_addr,
      const schema::bytes_view_t& payload) = 0;
};

}  // namespace ferry::relay
