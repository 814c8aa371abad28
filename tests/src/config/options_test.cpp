#include <ferry/config/options.hpp>
#include <ferry/testing/common.hpp>
#include <gtest/gtest.h>

#include <fstream>
#include <iterator>

namespace {

namespace po = boost::program_options;

using ferry::testing::make_hash;

const auto kAdminHex = ferry::schema::to_hex(make_hash(0xA0));
const auto kHubHex = ferry::schema::to_hex(make_hash(0x10));
const auto kEscrowHex = ferry::schema::to_hex(make_hash(0x20));
const auto kOutflowHex = ferry::schema::to_hex(make_hash(0x30));
const auto kSeedHex = ferry::schema::to_hex(make_hash(0x07));
const auto kEvmHex = std::string{"0x00112233445566778899aabbccddeeff00112233"};

template <std::size_t N>
bool load(const char* const (&argv)[N],
          const po::options_description& description,
          po::variables_map& vm,
          std::string& error) {
  return ferry::config::load(static_cast<int>(N), argv, description, vm, error);
}

}  // namespace

TEST(config_parsers, chain_ids_are_whole_unsigned_numbers) {
  EXPECT_EQ(ferry::config::parse_chain_id("30"), 30u);
  EXPECT_FALSE(ferry::config::parse_chain_id("").has_value());
  EXPECT_FALSE(ferry::config::parse_chain_id("3x").has_value());
  EXPECT_FALSE(ferry::config::parse_chain_id("-1").has_value());
  EXPECT_FALSE(ferry::config::parse_chain_id("4294967296").has_value());
}

TEST(config_parsers, routes_name_two_distinct_chains) {
  auto route =
      ferry::config::parse_route("1@localhost:26670->30@10.0.0.2:26671");
  ASSERT_TRUE(route.has_value());
  EXPECT_EQ(route->src_chain_id, 1u);
  EXPECT_EQ(route->src_target, "localhost:26670");
  EXPECT_EQ(route->dst_chain_id, 30u);
  EXPECT_EQ(route->dst_target, "10.0.0.2:26671");

  EXPECT_FALSE(ferry::config::parse_route("1@a:1->1@b:2").has_value());
  EXPECT_FALSE(ferry::config::parse_route("1@a:1").has_value());
  EXPECT_FALSE(ferry::config::parse_route("1@->30@b:2").has_value());
  EXPECT_FALSE(ferry::config::parse_route("hub@a:1->30@b:2").has_value());
}

TEST(config_parsers, remotes_pad_native_addresses) {
  auto remote = ferry::config::parse_remote("30:" + kEvmHex);
  ASSERT_TRUE(remote.has_value());
  EXPECT_EQ(remote->chain_id, 30u);
  EXPECT_EQ(remote->address,
            ferry::schema::make_address(kEvmHex));
  EXPECT_EQ(remote->address[0], 0u);
  EXPECT_EQ(remote->address[13], 0x11u);

  EXPECT_FALSE(ferry::config::parse_remote("30:").has_value());
  EXPECT_FALSE(ferry::config::parse_remote("30").has_value());
  EXPECT_FALSE(ferry::config::parse_remote("x:" + kEvmHex).has_value());
}

TEST(config_parsers, seeds_are_exactly_32_bytes) {
  EXPECT_EQ(ferry::config::parse_seed(kSeedHex), make_hash(0x07));
  EXPECT_FALSE(ferry::config::parse_seed(kSeedHex.substr(2)).has_value());
  EXPECT_FALSE(ferry::config::parse_seed("zz").has_value());
}

TEST(config_parsers, signers_carry_their_scheme) {
  auto ed25519 = ferry::config::parse_signer("ed25519:" + kSeedHex);
  ASSERT_TRUE(ed25519.has_value());
  ASSERT_TRUE(std::holds_alternative<ferry::schema::ed25519_signer_id>(*ed25519));
  EXPECT_EQ(std::get<ferry::schema::ed25519_signer_id>(*ed25519).public_key,
            make_hash(0x07));

  auto secp256k1 = ferry::config::parse_signer("secp256k1:02" + kSeedHex);
  ASSERT_TRUE(secp256k1.has_value());
  EXPECT_TRUE(
      std::holds_alternative<ferry::schema::secp256k1_signer_id>(*secp256k1));

  EXPECT_FALSE(ferry::config::parse_signer("secp256k1:" + kSeedHex).has_value());
  EXPECT_FALSE(ferry::config::parse_signer("rsa:" + kSeedHex).has_value());
  EXPECT_FALSE(ferry::config::parse_signer(kSeedHex).has_value());
}

TEST(node_options, hub_settings_from_command_line) {
  const char* const argv[] = {"ferryd",        "--chain-id",    "1",
                              "--role",        "hub",           "--admin",
                              kAdminHex.c_str(), "--hub-address", kHubHex.c_str(),
                              "--relay",       kSeedHex.c_str(), "--remote",
                              "30:0x20",       "--listen",      "127.0.0.1:9000"};
  auto vm = po::variables_map{};
  auto error = std::string{};
  ASSERT_TRUE(load(argv, ferry::config::make_node_options(), vm, error))
      << error;

  auto settings = ferry::config::make_node_settings(vm, error);

  ASSERT_TRUE(settings.has_value()) << error;
  EXPECT_EQ(settings->chain.chain_id, 1u);
  EXPECT_EQ(settings->chain.role, ferry::node::chain_role_t::hub);
  EXPECT_EQ(settings->chain.admin, make_hash(0xA0));
  EXPECT_EQ(settings->chain.hub.address, make_hash(0x10));
  ASSERT_EQ(settings->relays.size(), 1u);
  EXPECT_EQ(settings->relays[0], make_hash(0x07));
  ASSERT_EQ(settings->remotes.size(), 1u);
  EXPECT_EQ(settings->remotes[0].chain_id, 30u);
  EXPECT_EQ(settings->remotes[0].address[31], 0x20u);
  EXPECT_EQ(settings->listen_address, "127.0.0.1:9000");
  EXPECT_EQ(settings->db_path, "ferry-node.db");
  EXPECT_FALSE(settings->verbose);
}

TEST(node_options, connected_settings_use_defaults) {
  const char* const argv[] = {
      "ferryd",           "--chain-id",       "30",
      "--admin",          kAdminHex.c_str(),  "--hub-chain-id",
      "1",                "--hub-handler",    kHubHex.c_str(),
      "--escrow-address", kEscrowHex.c_str(), "--outflow-address",
      kOutflowHex.c_str(), "-v"};
  auto vm = po::variables_map{};
  auto error = std::string{};
  ASSERT_TRUE(load(argv, ferry::config::make_node_options(), vm, error));

  auto settings = ferry::config::make_node_settings(vm, error);

  ASSERT_TRUE(settings.has_value()) << error;
  const auto& chain = settings->chain;
  EXPECT_EQ(chain.role, ferry::node::chain_role_t::connected);
  EXPECT_EQ(chain.escrow.address, make_hash(0x20));
  EXPECT_EQ(chain.escrow.hub_chain_id, 1u);
  EXPECT_EQ(chain.escrow.hub_addr, make_hash(0x10));
  EXPECT_EQ(chain.escrow.release_mode, ferry::escrow::release_mode_t::gmp);
  EXPECT_EQ(chain.escrow.default_expiry, ferry::escrow::kDefaultExpiry);
  EXPECT_FALSE(chain.escrow.claim_signer.has_value());
  EXPECT_EQ(chain.outflow.address, make_hash(0x30));
  EXPECT_EQ(chain.outflow.hub_addr, make_hash(0x10));
  EXPECT_TRUE(settings->verbose);
}

TEST(node_options, connected_role_requires_its_handlers) {
  const char* const argv[] = {"ferryd",        "--chain-id",     "30",
                              "--admin",       kAdminHex.c_str(), "--hub-chain-id",
                              "1",             "--hub-handler",  kHubHex.c_str(),
                              "--outflow-address", kOutflowHex.c_str()};
  auto vm = po::variables_map{};
  auto error = std::string{};
  ASSERT_TRUE(load(argv, ferry::config::make_node_options(), vm, error));

  EXPECT_FALSE(ferry::config::make_node_settings(vm, error).has_value());
  EXPECT_NE(error.find("--escrow-address"), std::string::npos);
}

TEST(node_options, signer_release_requires_claim_signer) {
  const char* const argv[] = {
      "ferryd",           "--chain-id",       "30",
      "--admin",          kAdminHex.c_str(),  "--hub-chain-id",
      "1",                "--hub-handler",    kHubHex.c_str(),
      "--escrow-address", kEscrowHex.c_str(), "--outflow-address",
      kOutflowHex.c_str(), "--release-mode",   "signer"};
  auto vm = po::variables_map{};
  auto error = std::string{};
  ASSERT_TRUE(load(argv, ferry::config::make_node_options(), vm, error));

  EXPECT_FALSE(ferry::config::make_node_settings(vm, error).has_value());
  EXPECT_NE(error.find("--claim-signer"), std::string::npos);
}

TEST(node_options, rejects_unknown_role_and_options) {
  const char* const bad_role[] = {"ferryd", "--chain-id", "1", "--role",
                                  "spoke", "--admin", kAdminHex.c_str()};
  auto vm = po::variables_map{};
  auto error = std::string{};
  ASSERT_TRUE(load(bad_role, ferry::config::make_node_options(), vm, error));
  EXPECT_FALSE(ferry::config::make_node_settings(vm, error).has_value());
  EXPECT_NE(error.find("spoke"), std::string::npos);

  const char* const unknown[] = {"ferryd", "--no-such-flag"};
  auto other = po::variables_map{};
  EXPECT_FALSE(load(unknown, ferry::config::make_node_options(), other, error));
  EXPECT_FALSE(error.empty());
}

TEST(node_options, command_line_overrides_config_file) {
  auto path = ferry::testing::scoped_path{"ferry_node_ini"};
  {
    auto file = std::ofstream{path.path()};
    file << "chain-id = 5\n"
         << "role = hub\n"
         << "admin = " << kAdminHex << "\n"
         << "hub-address = " << kHubHex << "\n"
         << "db-path = /var/lib/ferry\n";
  }
  const char* const argv[] = {"ferryd", "--config", path.path().c_str(),
                              "--chain-id", "7"};
  auto vm = po::variables_map{};
  auto error = std::string{};
  ASSERT_TRUE(load(argv, ferry::config::make_node_options(), vm, error))
      << error;

  auto settings = ferry::config::make_node_settings(vm, error);

  ASSERT_TRUE(settings.has_value()) << error;
  EXPECT_EQ(settings->chain.chain_id, 7u);
  EXPECT_EQ(settings->chain.role, ferry::node::chain_role_t::hub);
  EXPECT_EQ(settings->db_path, "/var/lib/ferry");
}

TEST(node_options, missing_config_file_is_an_error) {
  const char* const argv[] = {"ferryd", "--config", "/nonexistent/ferry.ini"};
  auto vm = po::variables_map{};
  auto error = std::string{};
  EXPECT_FALSE(load(argv, ferry::config::make_node_options(), vm, error));
  EXPECT_NE(error.find("/nonexistent/ferry.ini"), std::string::npos);
}

TEST(relay_options, routes_and_timings) {
  const char* const argv[] = {"ferry-relay",
                              "--seed",
                              kSeedHex.c_str(),
                              "--route",
                              "1@hub:26670->30@spoke:26670",
                              "--route",
                              "30@spoke:26670->1@hub:26670",
                              "--backoff-base-ms",
                              "250",
                              "--batch-size",
                              "8"};
  auto vm = po::variables_map{};
  auto error = std::string{};
  ASSERT_TRUE(load(argv, ferry::config::make_relay_options(), vm, error));

  auto settings = ferry::config::make_relay_settings(vm, error);

  ASSERT_TRUE(settings.has_value()) << error;
  EXPECT_EQ(settings->seed, make_hash(0x07));
  ASSERT_EQ(settings->routes.size(), 2u);
  EXPECT_EQ(settings->routes[1].src_chain_id, 30u);
  EXPECT_EQ(settings->routes[1].dst_target, "hub:26670");
  EXPECT_EQ(settings->options.backoff.base, std::chrono::milliseconds{250});
  EXPECT_EQ(settings->options.backoff.max, std::chrono::milliseconds{30000});
  EXPECT_EQ(settings->options.poll_interval, std::chrono::milliseconds{1000});
  EXPECT_EQ(settings->options.batch_size, 8u);
  EXPECT_EQ(settings->rpc_timeout, std::chrono::milliseconds{5000});
}

TEST(relay_options, seed_and_route_are_required) {
  const char* const no_route[] = {"ferry-relay", "--seed", kSeedHex.c_str()};
  auto vm = po::variables_map{};
  auto error = std::string{};
  ASSERT_TRUE(load(no_route, ferry::config::make_relay_options(), vm, error));
  EXPECT_FALSE(ferry::config::make_relay_settings(vm, error).has_value());
  EXPECT_NE(error.find("--route"), std::string::npos);

  const char* const bad_seed[] = {"ferry-relay", "--seed", "abcd", "--route",
                                  "1@a:1->30@b:2"};
  auto other = po::variables_map{};
  ASSERT_TRUE(load(bad_seed, ferry::config::make_relay_options(), other, error));
  EXPECT_FALSE(ferry::config::make_relay_settings(other, error).has_value());
  EXPECT_NE(error.find("--seed"), std::string::npos);
}
