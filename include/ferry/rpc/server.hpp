#pragma once

#include <ferry/chain/v1/chain.grpc.pb.h>
#include <ferry/node/chain_node.hpp>

namespace ferry::rpc {

/// Relay-facing gRPC surface of a chain_node. Deliver is authenticated by an
/// ed25519 signature; the signing key becomes the relay identity checked by
/// the endpoint.
struct listener final : public ferry::chain::v1::ChainEndpoint::CallbackService {
  explicit listener(ferry::node::chain_node& node);

  virtual grpc::ServerUnaryReactor* GetInfo(
      grpc::CallbackServerContext* context,
      const ferry::chain::v1::GetInfoRequest* request,
      ferry::chain::v1::GetInfoResponse* response) override final;

  virtual grpc::ServerUnaryReactor* ListOutbound(
      grpc::CallbackServerContext* context,
      const ferry::chain::v1::ListOutboundRequest* request,
      ferry::chain::v1::ListOutboundResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Deliver(
      grpc::CallbackServerContext* context,
      const ferry::chain::v1::DeliverRequest* request,
      ferry::chain::v1::DeliverResponse* response) override final;

 private:
  ferry::node::chain_node& node_;
};

}  // namespace ferry::rpc
