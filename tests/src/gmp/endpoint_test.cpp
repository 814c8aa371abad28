#include <ferry/codec/message_codec.hpp>
#include <ferry/gmp/endpoint.hpp>
#include <ferry/testing/chain_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>

namespace {

using ferry::schema::error_code_t;
using ferry::schema::message_type_t;
using namespace ferry::testing;

ferry::schema::bytes_t make_requirements_payload(const uint8_t intent_seed) {
  return ferry::codec::encode(ferry::schema::intent_requirements_t{
      .intent_id = make_hash(intent_seed),
      .requester_addr = kRequester,
      .amount_required = 100,
      .token_addr = kConnectedToken,
      .expiry = kStartTime + 600});
}

ferry::schema::bytes_t make_proof_payload(const uint8_t intent_seed) {
  return ferry::codec::encode(ferry::schema::fulfillment_proof_t{
      .intent_id = make_hash(intent_seed),
      .solver_addr = kSolver,
      .amount_fulfilled = 100,
      .timestamp = kStartTime});
}

class endpoint_test : public ::testing::Test {
 protected:
  endpoint_test()
      : connected_{"ferry_endpoint", make_connected_config(), clock_} {
    node().add_relay(kAdmin, kRelay);
    node().add_remote_endpoint(kAdmin, kHubChainId, kHubHandler);
  }

  ferry::node::chain_node& node() { return connected_.node(); }

  ferry::schema::operation_result_t deliver(
      const ferry::schema::bytes_t& payload,
      const ferry::schema::address_t& relay = kRelay,
      const ferry::schema::chain_id_t src_chain_id = kHubChainId,
      const ferry::schema::address_t& src_addr = kHubHandler) {
    return node().deliver(relay, src_chain_id, src_addr,
                          ferry::schema::make_bytes_view(payload));
  }

  manual_clock clock_{kStartTime};
  node_fixture connected_;
};

}  // namespace

TEST_F(endpoint_test, initialization_authorizes_admin_and_starts_nonce_at_one) {
  EXPECT_TRUE(node().is_relay_authorized(kAdmin));
  EXPECT_TRUE(node().is_relay_authorized(kRelay));
  EXPECT_EQ(node().next_nonce(), 1u);
  EXPECT_TRUE(node().has_remote_endpoint(kHubChainId));
  EXPECT_FALSE(node().has_remote_endpoint(99));
}

TEST_F(endpoint_test, delivers_and_dispatches_requirements) {
  auto result = deliver(make_requirements_payload(0x01));

  ASSERT_TRUE(result.ok()) << result.log;
  EXPECT_TRUE(node().is_delivered(make_hash(0x01),
                                  message_type_t::intent_requirements));
  EXPECT_TRUE(node().escrow_requirements(make_hash(0x01)).has_value());
  EXPECT_TRUE(node().outflow_requirements(make_hash(0x01)).has_value());

  auto delivered = std::find_if(
      std::begin(result.events), std::end(result.events),
      [](const auto& event) { return event.type == "message_delivered"; });
  ASSERT_NE(delivered, std::end(result.events));
  ASSERT_NE(delivered->find("msg_type"), nullptr);
  EXPECT_EQ(*delivered->find("msg_type"), "intent_requirements");
}

TEST_F(endpoint_test, rejects_unauthorized_relay) {
  auto result = deliver(make_requirements_payload(0x01), make_hash(0xEE));
  EXPECT_EQ(result.code, error_code_t::unauthorized_relay);
  EXPECT_EQ(result.codespace, ferry::schema::kCodespaceEndpoint);
  EXPECT_TRUE(result.events.empty());
}

TEST_F(endpoint_test, rejects_unknown_source_chain_and_sender) {
  auto unknown_chain = deliver(make_requirements_payload(0x01), kRelay, 99);
  EXPECT_EQ(unknown_chain.code, error_code_t::no_remote_endpoint);

  auto unknown_sender = deliver(make_requirements_payload(0x01), kRelay,
                                kHubChainId, make_hash(0xEE));
  EXPECT_EQ(unknown_sender.code, error_code_t::unregistered_remote_endpoint);
  EXPECT_FALSE(node().is_delivered(make_hash(0x01),
                                   message_type_t::intent_requirements));
}

TEST_F(endpoint_test, rejects_malformed_payloads) {
  auto short_payload = ferry::schema::bytes_t(10, 0x01);
  EXPECT_EQ(deliver(short_payload).code, error_code_t::invalid_payload);

  auto unknown_tag = ferry::schema::bytes_t(40, 0x00);
  unknown_tag[0] = 0x07;
  EXPECT_EQ(deliver(unknown_tag).code, error_code_t::invalid_payload);

  auto truncated = make_requirements_payload(0x01);
  truncated.pop_back();
  EXPECT_EQ(deliver(truncated).code, error_code_t::invalid_length);
}

TEST_F(endpoint_test, second_delivery_of_same_message_is_already_delivered) {
  ASSERT_TRUE(deliver(make_requirements_payload(0x01)).ok());

  auto replay = deliver(make_requirements_payload(0x01));

  EXPECT_EQ(replay.code, error_code_t::already_delivered);
  EXPECT_TRUE(ferry::schema::is_terminal(replay.code));
}

TEST_F(endpoint_test, failing_handler_leaves_message_undelivered) {
  // No escrow exists yet, so the proof handler fails.
  auto result = deliver(make_proof_payload(0x02));

  EXPECT_EQ(result.code, error_code_t::does_not_exist);
  EXPECT_FALSE(
      node().is_delivered(make_hash(0x02), message_type_t::fulfillment_proof));
}

TEST_F(endpoint_test, admin_manages_relays) {
  auto other = make_hash(0xC0);
  EXPECT_EQ(node().add_relay(kRequester, other).code,
            error_code_t::unauthorized_admin);
  EXPECT_EQ(node().add_relay(kAdmin, kRelay).code,
            error_code_t::relay_already_exists);
  EXPECT_EQ(node().remove_relay(kAdmin, other).code,
            error_code_t::relay_not_found);

  ASSERT_TRUE(node().remove_relay(kAdmin, kRelay).ok());
  EXPECT_FALSE(node().is_relay_authorized(kRelay));
  EXPECT_EQ(deliver(make_requirements_payload(0x01)).code,
            error_code_t::unauthorized_relay);

  ASSERT_TRUE(node().add_relay(kAdmin, kRelay).ok());
  EXPECT_TRUE(deliver(make_requirements_payload(0x01)).ok());
}

TEST_F(endpoint_test, remote_endpoints_require_admin_and_nonzero_address) {
  EXPECT_EQ(node().add_remote_endpoint(kRequester, 5, make_hash(0x01)).code,
            error_code_t::unauthorized_admin);
  EXPECT_EQ(
      node().add_remote_endpoint(kAdmin, 5, ferry::schema::make_zero_hash()).code,
      error_code_t::invalid_address);

  ASSERT_TRUE(node().set_remote_endpoint(kAdmin, kHubChainId, make_hash(0x90)).ok());
  EXPECT_EQ(deliver(make_requirements_payload(0x01)).code,
            error_code_t::unregistered_remote_endpoint);
}

TEST_F(endpoint_test, handlers_must_be_local) {
  auto result = node().set_handlers(
      kAdmin, message_type_t::escrow_confirmation, {make_hash(0xEE)});
  EXPECT_EQ(result.code, error_code_t::handler_not_configured);

  EXPECT_EQ(node()
                .set_handlers(kRequester, message_type_t::escrow_confirmation,
                              {kEscrowHandler})
                .code,
            error_code_t::unauthorized_admin);
}

TEST(endpoint_routes, unconfigured_type_is_a_hard_failure) {
  auto clock = manual_clock{kStartTime};
  auto signer = ferry::schema::signer_id_t{ferry::schema::ed25519_signer_id{}};
  auto fixture = node_fixture{
      "ferry_endpoint_signer",
      make_connected_config(ferry::escrow::release_mode_t::signer, signer),
      clock};
  auto& node = fixture.node();
  node.add_remote_endpoint(kAdmin, kHubChainId, kHubHandler);
  auto payload = make_proof_payload(0x03);

  auto result = node.deliver(kAdmin, kHubChainId, kHubHandler,
                             ferry::schema::make_bytes_view(payload));

  EXPECT_EQ(result.code, error_code_t::handler_not_configured);
  EXPECT_FALSE(
      node.is_delivered(make_hash(0x03), message_type_t::fulfillment_proof));
}

TEST(endpoint_routes, explicit_empty_binding_records_delivery_only) {
  auto clock = manual_clock{kStartTime};
  auto signer = ferry::schema::signer_id_t{ferry::schema::ed25519_signer_id{}};
  auto fixture = node_fixture{
      "ferry_endpoint_empty",
      make_connected_config(ferry::escrow::release_mode_t::signer, signer),
      clock};
  auto& node = fixture.node();
  node.add_remote_endpoint(kAdmin, kHubChainId, kHubHandler);
  ASSERT_TRUE(
      node.set_handlers(kAdmin, message_type_t::fulfillment_proof, {}).ok());
  auto payload = make_proof_payload(0x04);

  auto result = node.deliver(kAdmin, kHubChainId, kHubHandler,
                             ferry::schema::make_bytes_view(payload));

  EXPECT_TRUE(result.ok()) << result.log;
  EXPECT_TRUE(
      node.is_delivered(make_hash(0x04), message_type_t::fulfillment_proof));
}

TEST(endpoint_routes, message_types_deduplicate_independently) {
  auto network = network_fixture{};
  auto& hub = network.hub();
  auto confirmation = ferry::codec::encode(ferry::schema::escrow_confirmation_t{
      .intent_id = make_hash(0x05), .amount_escrowed = 1});
  auto proof = make_proof_payload(0x05);

  // Neither is tracked by the hub, so both land as no-ops.
  EXPECT_TRUE(hub.deliver(kRelay, kConnectedChainId, kEscrowHandler,
                          ferry::schema::make_bytes_view(confirmation))
                  .ok());
  EXPECT_TRUE(hub.deliver(kRelay, kConnectedChainId, kOutflowHandler,
                          ferry::schema::make_bytes_view(proof))
                  .ok());
  EXPECT_EQ(hub.deliver(kRelay, kConnectedChainId, kOutflowHandler,
                        ferry::schema::make_bytes_view(proof))
                .code,
            error_code_t::already_delivered);
}

TEST(endpoint_mailbox, sends_are_numbered_and_listed_in_order) {
  auto network = network_fixture{};
  auto& hub = network.hub();
  hub.mint(kAdmin, kHubToken, kRequester, 1000);

  for (uint8_t i = 1; i <= 3; ++i) {
    auto result = hub.create_inflow_intent(
        kRequester, ferry::hub::hub_intent_params{
                        .intent_id = make_hash(i),
                        .connected_chain_id = kConnectedChainId,
                        .connected_handler_addr = kEscrowHandler,
                        .connected_token_addr = kConnectedToken,
                        .connected_amount = 10,
                        .hub_token_addr = kHubToken,
                        .hub_amount = 10,
                        .expiry = kStartTime + 600});
    ASSERT_TRUE(result.ok()) << result.log;
    EXPECT_EQ(ferry::gmp::sent_nonce(result), ferry::schema::nonce_t{i});
  }

  EXPECT_EQ(hub.next_nonce(), 4u);
  auto all = hub.list_outbound(0, 10);
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0].nonce, 1u);
  EXPECT_EQ(all[2].nonce, 3u);
  EXPECT_EQ(all[0].src_addr, kHubHandler);
  EXPECT_EQ(all[0].dst_chain_id, kConnectedChainId);
  EXPECT_EQ(all[0].dst_addr, kEscrowHandler);

  auto tail = hub.list_outbound(1, 1);
  ASSERT_EQ(tail.size(), 1u);
  EXPECT_EQ(tail[0].nonce, 2u);
  EXPECT_TRUE(hub.list_outbound(3, 10).empty());
}
