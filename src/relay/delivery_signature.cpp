#include <ferry/crypto/verify.hpp>
#include <ferry/relay/delivery_signature.hpp>
#include <ferry/schema/key/builder.hpp>

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace ferry::relay {

schema::bytes_t make_delivery_signing_bytes(
    const schema::chain_id_t src_chain_id,
    const schema::chain_id_t dst_chain_id,
    const schema::address_t& src_addr,
    const schema::bytes_view_t& payload) {
  auto builder = schema::key::builder{};
  builder.write(src_chain_id)
      .write(dst_chain_id)
      .write(std::span<const uint8_t>{src_addr.data(), src_addr.size()})
      .write(payload);
  return std::move(builder.data);
}

schema::operation_result_t verify_delivery_signature(
    const schema::chain_id_t local_chain_id,
    const schema::chain_id_t src_chain_id,
    const schema::chain_id_t dst_chain_id,
    const schema::address_t& src_addr,
    const schema::bytes_view_t& payload,
    const schema::ed25519_signer_id& relay,
    const schema::ed25519_signature_t& signature) {
  if (dst_chain_id != local_chain_id) {
    return schema::make_error_result(
        schema::error_code_t::wrong_destination_chain,
        schema::kCodespaceEndpoint,
        fmt::format("delivery addressed to chain {}, this is chain {}",
                    dst_chain_id, local_chain_id));
  }
  auto signed_bytes =
      make_delivery_signing_bytes(src_chain_id, dst_chain_id, src_addr, payload);
  if (!crypto::verify_signature(schema::make_bytes_view(signed_bytes),
                                schema::signer_id_t{relay},
                                schema::signature_t{signature})) {
    return schema::make_error_result(schema::error_code_t::invalid_signature,
                                     schema::kCodespaceEndpoint,
                                     "relay signature does not verify");
  }
  return {};
}

}  // namespace ferry::relay
