#pragma once
#include <ferry/schema/operation_result.hpp>
#include <ferry/schema/primitives.hpp>

namespace ferry::relay {

// Bytes a relay signs when delivering over the network:
// be32(src_chain_id) || be32(dst_chain_id) || src_addr || payload.
schema::bytes_t make_delivery_signing_bytes(schema::chain_id_t src_chain_id,
                                            schema::chain_id_t dst_chain_id,
                                            const schema::address_t& src_addr,
                                            const schema::bytes_view_t& payload);

/// Accepts a signed delivery only when it is addressed to `local_chain_id`
/// and the relay's signature covers it. Fails with wrong_destination_chain or
/// invalid_signature.
schema::operation_result_t verify_delivery_signature(
    schema::chain_id_t local_chain_id,
    schema::chain_id_t src_chain_id,
    schema::chain_id_t dst_chain_id,
    const schema::address_t& src_addr,
    const schema::bytes_view_t& payload,
    const schema::ed25519_signer_id& relay,
    const schema::ed25519_signature_t& signature);

}  // namespace ferry::relay
