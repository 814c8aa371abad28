#pragma once

#include <ferry/chain/v1/chain.grpc.pb.h>
#include <ferry/relay/chain_client.hpp>

#include <grpcpp/grpcpp.h>

#include <chrono>
#include <memory>
#include <string>

namespace ferry::rpc {

/// chain_client over the ChainEndpoint gRPC service. Deliveries are signed
/// with the relay's ed25519 seed.
class grpc_chain_client final : public ferry::relay::chain_client {
 public:
  grpc_chain_client(ferry::schema::chain_id_t chain_id,
                    std::shared_ptr<grpc::Channel> channel,
                    const ferry::schema::ed25519_seed_t& seed,
                    std::chrono::milliseconds timeout);

  ferry::schema::chain_id_t chain_id() const override;
  std::optional<std::vector<ferry::schema::outbound_message_t>> list_outbound(
      ferry::schema::nonce_t after,
      std::size_t limit) override;
  ferry::schema::operation_result_t deliver(
      ferry::schema::chain_id_t src_chain_id,
      const ferry::schema::address_t& src_addr,
      const ferry::schema::bytes_view_t& payload) override;

  /// Reported chain id, or nullopt when the node is unreachable.
  std::optional<ferry::chain::v1::GetInfoResponse> info();

 private:
  void set_deadline(grpc::ClientContext& context) const;

  ferry::schema::chain_id_t chain_id_;
  std::unique_ptr<ferry::chain::v1::ChainEndpoint::Stub> stub_;
  ferry::schema::ed25519_seed_t seed_;
  ferry::schema::ed25519_signer_id public_key_;
  std::chrono::milliseconds timeout_;
};

std::shared_ptr<grpc::Channel> make_channel(const std::string& target);

}  // namespace ferry::rpc
