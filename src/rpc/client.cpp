#include <ferry/common/critical.hpp>
#include <ferry/crypto/verify.hpp>
#include <ferry/relay/delivery_signature.hpp>
#include <ferry/rpc/client.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>

using namespace ferry::rpc;
using namespace ferry::schema;

namespace {

std::optional<address_t> to_address(const std::string& value) {
  return try_make_hash32(make_bytes_view(value));
}

}  // namespace

namespace ferry::rpc {

std::shared_ptr<grpc::Channel> make_channel(const std::string& target) {
  return grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
}

}  // namespace ferry::rpc

grpc_chain_client::grpc_chain_client(const chain_id_t chain_id,
                                     std::shared_ptr<grpc::Channel> channel,
                                     const ed25519_seed_t& seed,
                                     const std::chrono::milliseconds timeout)
    : chain_id_{chain_id},
      stub_{ferry::chain::v1::ChainEndpoint::NewStub(channel)},
      seed_{seed},
      timeout_{timeout} {
  auto public_key = ferry::crypto::ed25519_public_key(seed_);
  if (!public_key) {
    ferry::common::critical("failed to derive relay ed25519 public key");
  }
  public_key_ = *public_key;
}

chain_id_t grpc_chain_client::chain_id() const {
  return chain_id_;
}

void grpc_chain_client::set_deadline(grpc::ClientContext& context) const {
  context.set_deadline(std::chrono::system_clock::now() + timeout_);
}

std::optional<ferry::chain::v1::GetInfoResponse> grpc_chain_client::info() {
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto request = ferry::chain::v1::GetInfoRequest{};
  auto response = ferry::chain::v1::GetInfoResponse{};
  auto status = stub_->GetInfo(&context, request, &response);
  if (!status.ok()) {
    spdlog::warn("chain {} GetInfo failed: {}", chain_id_,
                 status.error_message());
    return std::nullopt;
  }
  return response;
}

std::optional<std::vector<outbound_message_t>> grpc_chain_client::list_outbound(
    const nonce_t after,
    const std::size_t limit) {
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto request = ferry::chain::v1::ListOutboundRequest{};
  request.set_after_nonce(after);
  request.set_limit(static_cast<uint32_t>(
      std::min<std::size_t>(limit, std::numeric_limits<uint32_t>::max())));
  auto response = ferry::chain::v1::ListOutboundResponse{};
  auto status = stub_->ListOutbound(&context, request, &response);
  if (!status.ok()) {
    spdlog::warn("chain {} ListOutbound failed: {}", chain_id_,
                 status.error_message());
    return std::nullopt;
  }

  auto messages = std::vector<outbound_message_t>{};
  messages.reserve(static_cast<std::size_t>(response.messages_size()));
  for (const auto& message : response.messages()) {
    auto src_addr = to_address(message.src_addr());
    auto dst_addr = to_address(message.dst_addr());
    if (!src_addr || !dst_addr) {
      spdlog::error("chain {} returned malformed mailbox entry {}", chain_id_,
                    message.nonce());
      return std::nullopt;
    }
    messages.push_back(outbound_message_t{.nonce = message.nonce(),
                                          .src_addr = *src_addr,
                                          .dst_chain_id = message.dst_chain_id(),
                                          .dst_addr = *dst_addr,
                                          .payload = make_bytes(message.payload())});
  }
  return messages;
}

operation_result_t grpc_chain_client::deliver(const chain_id_t src_chain_id,
                                              const address_t& src_addr,
                                              const bytes_view_t& payload) {
  auto signed_bytes = ferry::relay::make_delivery_signing_bytes(
      src_chain_id, chain_id_, src_addr, payload);
  auto signature =
      ferry::crypto::sign_ed25519(make_bytes_view(signed_bytes), seed_);
  if (!signature) {
    ferry::common::critical("failed to sign delivery");
  }

  auto request = ferry::chain::v1::DeliverRequest{};
  request.set_src_chain_id(src_chain_id);
  request.set_dst_chain_id(chain_id_);
  request.set_src_addr(
      make_string(bytes_view_t{src_addr.data(), src_addr.size()}));
  request.set_payload(make_string(payload));
  request.set_relay_public_key(make_string(bytes_view_t{
      public_key_.public_key.data(), public_key_.public_key.size()}));
  request.set_signature(
      make_string(bytes_view_t{signature->data(), signature->size()}));

  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto response = ferry::chain::v1::DeliverResponse{};
  auto status = stub_->Deliver(&context, request, &response);
  if (!status.ok()) {
    return make_error_result(error_code_t::transport_failure, kCodespaceNode,
                             status.error_message());
  }
  auto result = operation_result_t{};
  result.code = static_cast<error_code_t>(response.code());
  result.log = response.log();
  result.codespace = response.codespace();
  return result;
}
