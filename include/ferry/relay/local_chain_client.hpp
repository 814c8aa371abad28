#pragma once
#include <ferry/node/chain_node.hpp>
#include <ferry/relay/chain_client.hpp>

namespace ferry::relay {

/// In-process client over a chain_node, delivering as `relay`.
class local_chain_client final : public chain_client {
 public:
  local_chain_client(node::chain_node& node, schema::address_t relay);

  schema::chain_id_t chain_id() const override;
  std::optional<std::vector<schema::outbound_message_t>> list_outbound(
      schema::nonce_t after,
      std::size_t limit) override;
  schema::operation_result_t deliver(
      schema::chain_id_t src_chain_id,
      const schema::address_t& src_addr,
      const schema::bytes_view_t& payload) override;

 private:
  node::chain_node& node_;
  schema::address_t relay_;
};

}  // namespace ferry::relay
