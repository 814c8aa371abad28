#include <ferry/relay/local_chain_client.hpp>

namespace ferry::relay {

local_chain_client::local_chain_client(node::chain_node& node,
                                       schema::address_t relay)
    : node_{node}, relay_{relay} {}

schema::chain_id_t local_chain_client::chain_id() const {
  return node_.chain_id();
}

std::optional<std::vector<schema::outbound_message_t>>
local_chain_client::list_outbound(const schema::nonce_t after,
                                  const std::size_t limit) {
  return node_.list_outbound(after, limit);
}

schema::operation_result_t local_chain_client::deliver(
    const schema::chain_id_t src_chain_id,
    const schema::address_t& src_addr,
    const schema::bytes_view_t& payload) {
  return node_.deliver(relay_, src_chain_id, src_addr, payload);
}

}  // namespace ferry::relay
