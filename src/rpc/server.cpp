#include <ferry/relay/delivery_signature.hpp>
#include <ferry/rpc/server.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

using namespace ferry::rpc;
using namespace ferry::schema;

namespace {

inline constexpr auto kMaxListLimit = uint32_t{1024};

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

void set_result(ferry::chain::v1::DeliverResponse* response,
                const operation_result_t& result) {
  response->set_code(static_cast<uint32_t>(result.code));
  response->set_log(result.log);
  response->set_codespace(result.codespace);
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_array(const std::string& value) {
  if (value.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(value), std::end(value), std::begin(out));
  return out;
}

}  // namespace

listener::listener(ferry::node::chain_node& node) : node_{node} {}

grpc::ServerUnaryReactor* listener::GetInfo(
    grpc::CallbackServerContext* context,
    const ferry::chain::v1::GetInfoRequest* /*request*/,
    ferry::chain::v1::GetInfoResponse* response) {
  response->set_chain_id(node_.chain_id());
  response->set_next_outbound_nonce(node_.next_nonce());
  response->set_role(std::string{ferry::node::to_string(node_.role())});
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::ListOutbound(
    grpc::CallbackServerContext* context,
    const ferry::chain::v1::ListOutboundRequest* request,
    ferry::chain::v1::ListOutboundResponse* response) {
  auto limit = std::min(request->limit() == 0 ? kMaxListLimit : request->limit(),
                        kMaxListLimit);
  auto messages = node_.list_outbound(request->after_nonce(), limit);
  for (const auto& message : messages) {
    auto* out = response->add_messages();
    out->set_nonce(message.nonce);
    out->set_src_addr(make_string(
        bytes_view_t{message.src_addr.data(), message.src_addr.size()}));
    out->set_dst_chain_id(message.dst_chain_id);
    out->set_dst_addr(make_string(
        bytes_view_t{message.dst_addr.data(), message.dst_addr.size()}));
    out->set_payload(make_string(make_bytes_view(message.payload)));
  }
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Deliver(
    grpc::CallbackServerContext* context,
    const ferry::chain::v1::DeliverRequest* request,
    ferry::chain::v1::DeliverResponse* response) {
  auto src_addr = try_make_hash32(make_bytes_view(request->src_addr()));
  if (!src_addr) {
    set_result(response, make_error_result(error_code_t::invalid_address,
                                           kCodespaceEndpoint,
                                           "src_addr must be 32 bytes"));
    return finish_ok(context);
  }
  auto public_key = try_make_array<32>(request->relay_public_key());
  auto signature = try_make_array<64>(request->signature());
  if (!public_key || !signature) {
    set_result(response, make_error_result(error_code_t::invalid_signature,
                                           kCodespaceEndpoint,
                                           "malformed relay key or signature"));
    return finish_ok(context);
  }

  auto payload = make_bytes(request->payload());
  auto checked = ferry::relay::verify_delivery_signature(
      node_.chain_id(), request->src_chain_id(), request->dst_chain_id(),
      *src_addr, make_bytes_view(payload),
      ed25519_signer_id{.public_key = *public_key}, *signature);
  if (!checked.ok()) {
    spdlog::warn("rejected delivery from relay {}: {}",
                 to_hex(bytes_view_t{public_key->data(), public_key->size()}),
                 checked.log);
    set_result(response, checked);
    return finish_ok(context);
  }

  auto result = node_.deliver(*public_key, request->src_chain_id(), *src_addr,
                              make_bytes_view(payload));
  set_result(response, result);
  return finish_ok(context);
}
