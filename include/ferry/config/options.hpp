#pragma once
#include <ferry/node/chain_node.hpp>
#include <ferry/relay/relay_service.hpp>
#include <ferry/schema/primitives.hpp>

#include <boost/program_options.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ferry::config {

/// `src_chain_id@host:port->dst_chain_id@host:port`
struct route_spec final {
  schema::chain_id_t src_chain_id{};
  std::string src_target;
  schema::chain_id_t dst_chain_id{};
  std::string dst_target;
};

/// `chain_id:0x<address>`
struct remote_spec final {
  schema::chain_id_t chain_id{};
  schema::address_t address{};
};

struct node_settings final {
  node::chain_config chain;
  std::vector<schema::address_t> relays;
  std::vector<remote_spec> remotes;
  std::string db_path;
  std::string listen_address;
  std::string log_file;
  bool verbose{};
};

struct relay_settings final {
  schema::ed25519_seed_t seed{};
  std::vector<route_spec> routes;
  relay::relay_options options;
  std::chrono::milliseconds rpc_timeout{5000};
  std::string db_path;
  std::string log_file;
  bool verbose{};
};

std::optional<schema::chain_id_t> parse_chain_id(std::string_view value);
std::optional<schema::address_t> parse_address(std::string_view value);
std::optional<route_spec> parse_route(std::string_view value);
std::optional<remote_spec> parse_remote(std::string_view value);
std::optional<schema::ed25519_seed_t> parse_seed(std::string_view value);

/// `ed25519:<hex public key>` or `secp256k1:<hex compressed key>`
std::optional<schema::signer_id_t> parse_signer(std::string_view value);

boost::program_options::options_description make_node_options();
boost::program_options::options_description make_relay_options();

/// Reads argv and, when `--config` names a file, the INI file beneath it.
/// Returns false and fills `error` when parsing fails.
bool load(int argc,
          const char* const argv[],
          const boost::program_options::options_description& description,
          boost::program_options::variables_map& vm,
          std::string& error);

std::optional<node_settings> make_node_settings(
    const boost::program_options::variables_map& vm,
    std::string& error);
std::optional<relay_settings> make_relay_settings(
    const boost::program_options::variables_map& vm,
    std::string& error);

}  // namespace ferry::config
