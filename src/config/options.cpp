#include <ferry/config/options.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <charconv>
#include <fstream>
#include <utility>

namespace po = boost::program_options;

namespace ferry::config {

namespace {

std::optional<std::pair<std::string_view, std::string_view>> split(
    const std::string_view value,
    const std::string_view separator) {
  auto position = value.find(separator);
  if (position == std::string_view::npos) {
    return std::nullopt;
  }
  return std::pair{value.substr(0, position),
                   value.substr(position + separator.size())};
}

std::optional<std::pair<schema::chain_id_t, std::string>> parse_chain_target(
    const std::string_view value) {
  auto parts = split(value, "@");
  if (!parts || parts->second.empty()) {
    return std::nullopt;
  }
  auto chain_id = parse_chain_id(parts->first);
  if (!chain_id) {
    return std::nullopt;
  }
  return std::pair{*chain_id, std::string{parts->second}};
}

template <typename T>
std::vector<T> values_or_empty(const po::variables_map& vm,
                               const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<T>>();
}

std::optional<schema::address_t> required_address(const po::variables_map& vm,
                                                  const std::string& name,
                                                  std::string& error) {
  if (!vm.contains(name)) {
    error = fmt::format("--{} is required", name);
    return std::nullopt;
  }
  auto address = parse_address(vm[name].as<std::string>());
  if (!address) {
    error = fmt::format("--{} is not a valid address", name);
  }
  return address;
}

std::chrono::milliseconds milliseconds_of(const po::variables_map& vm,
                                          const std::string& name) {
  return std::chrono::milliseconds{
      static_cast<std::chrono::milliseconds::rep>(vm[name].as<uint64_t>())};
}

}  // namespace

std::optional<schema::chain_id_t> parse_chain_id(const std::string_view value) {
  auto chain_id = schema::chain_id_t{};
  auto [end, ec] =
      std::from_chars(value.data(), value.data() + value.size(), chain_id);
  if (ec != std::errc{} || end != value.data() + value.size() ||
      value.empty()) {
    return std::nullopt;
  }
  return chain_id;
}

std::optional<schema::address_t> parse_address(const std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return schema::try_make_address(value);
}

std::optional<route_spec> parse_route(const std::string_view value) {
  auto sides = split(value, "->");
  if (!sides) {
    return std::nullopt;
  }
  auto source = parse_chain_target(sides->first);
  auto destination = parse_chain_target(sides->second);
  if (!source || !destination || source->first == destination->first) {
    return std::nullopt;
  }
  return route_spec{.src_chain_id = source->first,
                    .src_target = std::move(source->second),
                    .dst_chain_id = destination->first,
                    .dst_target = std::move(destination->second)};
}

std::optional<remote_spec> parse_remote(const std::string_view value) {
  auto parts = split(value, ":");
  if (!parts) {
    return std::nullopt;
  }
  auto chain_id = parse_chain_id(parts->first);
  auto address = parse_address(parts->second);
  if (!chain_id || !address) {
    return std::nullopt;
  }
  return remote_spec{.chain_id = *chain_id, .address = *address};
}

std::optional<schema::ed25519_seed_t> parse_seed(const std::string_view value) {
  auto seed = schema::try_make_hash32(value);
  if (!seed) {
    return std::nullopt;
  }
  return *seed;
}

std::optional<schema::signer_id_t> parse_signer(const std::string_view value) {
  auto parts = split(value, ":");
  if (!parts) {
    return std::nullopt;
  }
  auto key = schema::try_from_hex(parts->second);
  if (!key) {
    return std::nullopt;
  }
  if (parts->first == "ed25519") {
    auto signer = schema::ed25519_signer_id{};
    if (key->size() != signer.public_key.size()) {
      return std::nullopt;
    }
    std::copy(std::begin(*key), std::end(*key), std::begin(signer.public_key));
    return schema::signer_id_t{signer};
  }
  if (parts->first == "secp256k1") {
    auto signer = schema::secp256k1_signer_id{};
    if (key->size() != signer.public_key.size()) {
      return std::nullopt;
    }
    std::copy(std::begin(*key), std::end(*key), std::begin(signer.public_key));
    return schema::signer_id_t{signer};
  }
  return std::nullopt;
}

po::options_description make_node_options() {
  auto description = po::options_description{"ferryd"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI-style configuration file")(
      "verbose,v", "Enable debug logging")(
      "chain-id", po::value<schema::chain_id_t>(), "Id of this chain")(
      "role", po::value<std::string>()->default_value("connected"),
      "hub or connected")("admin", po::value<std::string>(),
                          "Deployment admin address (hex)")(
      "hub-chain-id", po::value<schema::chain_id_t>(),
      "Hub chain id (connected role)")(
      "hub-handler", po::value<std::string>(),
      "Hub intents handler address (connected role)")(
      "escrow-address", po::value<std::string>(),
      "Escrow handler address (connected role)")(
      "outflow-address", po::value<std::string>(),
      "Outflow validator address (connected role)")(
      "hub-address", po::value<std::string>(),
      "Hub intents handler address (hub role)")(
      "default-expiry",
      po::value<schema::duration_seconds_t>()->default_value(
          escrow::kDefaultExpiry),
      "Escrow expiry in seconds when none is given")(
      "release-mode", po::value<std::string>()->default_value("gmp"),
      "Escrow release path: gmp or signer")(
      "claim-signer", po::value<std::string>(),
      "Escrow claim signer, ed25519:<hex> or secp256k1:<hex>")(
      "relay", po::value<std::vector<std::string>>()->composing(),
      "Authorized relay address (repeatable)")(
      "remote", po::value<std::vector<std::string>>()->composing(),
      "Trusted remote endpoint chain_id:0xaddress (repeatable)")(
      "db-path", po::value<std::string>()->default_value("ferry-node.db"),
      "RocksDB directory")(
      "listen", po::value<std::string>()->default_value("0.0.0.0:26670"),
      "IP:Port for the gRPC server")(
      "log-file", po::value<std::string>()->default_value("ferryd.log"),
      "Log file path");
  return description;
}

po::options_description make_relay_options() {
  auto description = po::options_description{"ferry-relay"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI-style configuration file")(
      "verbose,v", "Enable debug logging")(
      "seed", po::value<std::string>(), "Relay ed25519 seed (hex)")(
      "route", po::value<std::vector<std::string>>()->composing(),
      "src_chain_id@host:port->dst_chain_id@host:port (repeatable)")(
      "db-path", po::value<std::string>()->default_value("ferry-relay.db"),
      "RocksDB directory for relay cursors")(
      "poll-interval-ms", po::value<uint64_t>()->default_value(1000),
      "Delay between mailbox polls")(
      "backoff-base-ms", po::value<uint64_t>()->default_value(500),
      "First retry delay")(
      "backoff-max-ms", po::value<uint64_t>()->default_value(30000),
      "Longest retry delay")(
      "batch-size", po::value<std::size_t>()->default_value(64),
      "Mailbox entries in flight per route")(
      "rpc-timeout-ms", po::value<uint64_t>()->default_value(5000),
      "Deadline for each gRPC call")(
      "log-file", po::value<std::string>()->default_value("ferry-relay.log"),
      "Log file path");
  return description;
}

bool load(const int argc,
          const char* const argv[],
          const po::options_description& description,
          po::variables_map& vm,
          std::string& error) {
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        error = fmt::format("cannot open config file {}", path);
        return false;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    error = e.what();
    return false;
  }
  return true;
}

std::optional<node_settings> make_node_settings(const po::variables_map& vm,
                                                std::string& error) {
  auto settings = node_settings{};
  if (!vm.contains("chain-id")) {
    error = "--chain-id is required";
    return std::nullopt;
  }
  settings.chain.chain_id = vm["chain-id"].as<schema::chain_id_t>();

  auto role = schema::try_from_string<node::chain_role_t>(
      vm["role"].as<std::string>());
  if (!role) {
    error = fmt::format("unknown role {}", vm["role"].as<std::string>());
    return std::nullopt;
  }
  settings.chain.role = *role;

  auto admin = required_address(vm, "admin", error);
  if (!admin) {
    return std::nullopt;
  }
  settings.chain.admin = *admin;

  if (settings.chain.role == node::chain_role_t::hub) {
    auto hub_address = required_address(vm, "hub-address", error);
    if (!hub_address) {
      return std::nullopt;
    }
    settings.chain.hub.address = *hub_address;
  } else {
    if (!vm.contains("hub-chain-id")) {
      error = "--hub-chain-id is required";
      return std::nullopt;
    }
    auto hub_chain_id = vm["hub-chain-id"].as<schema::chain_id_t>();
    auto hub_handler = required_address(vm, "hub-handler", error);
    auto escrow_address = required_address(vm, "escrow-address", error);
    auto outflow_address = required_address(vm, "outflow-address", error);
    if (!hub_handler || !escrow_address || !outflow_address) {
      return std::nullopt;
    }

    auto release_mode = schema::try_from_string<escrow::release_mode_t>(
        vm["release-mode"].as<std::string>());
    if (!release_mode) {
      error = fmt::format("unknown release mode {}",
                          vm["release-mode"].as<std::string>());
      return std::nullopt;
    }

    auto& escrow = settings.chain.escrow;
    escrow.address = *escrow_address;
    escrow.hub_chain_id = hub_chain_id;
    escrow.hub_addr = *hub_handler;
    escrow.default_expiry = vm["default-expiry"].as<schema::duration_seconds_t>();
    escrow.release_mode = *release_mode;
    if (vm.contains("claim-signer")) {
      escrow.claim_signer = parse_signer(vm["claim-signer"].as<std::string>());
      if (!escrow.claim_signer) {
        error = "--claim-signer is not a valid signer";
        return std::nullopt;
      }
    }
    if (escrow.release_mode == escrow::release_mode_t::signer &&
        !escrow.claim_signer) {
      error = "--release-mode signer requires --claim-signer";
      return std::nullopt;
    }

    auto& outflow = settings.chain.outflow;
    outflow.address = *outflow_address;
    outflow.hub_chain_id = hub_chain_id;
    outflow.hub_addr = *hub_handler;
  }

  for (const auto& value : values_or_empty<std::string>(vm, "relay")) {
    auto relay = parse_address(value);
    if (!relay) {
      error = fmt::format("invalid relay address {}", value);
      return std::nullopt;
    }
    settings.relays.push_back(*relay);
  }
  for (const auto& value : values_or_empty<std::string>(vm, "remote")) {
    auto remote = parse_remote(value);
    if (!remote) {
      error = fmt::format("invalid remote {}", value);
      return std::nullopt;
    }
    settings.remotes.push_back(*remote);
  }

  settings.db_path = vm["db-path"].as<std::string>();
  settings.listen_address = vm["listen"].as<std::string>();
  settings.log_file = vm["log-file"].as<std::string>();
  settings.verbose = vm.contains("verbose");
  return settings;
}

std::optional<relay_settings> make_relay_settings(const po::variables_map& vm,
                                                  std::string& error) {
  auto settings = relay_settings{};
  if (!vm.contains("seed")) {
    error = "--seed is required";
    return std::nullopt;
  }
  auto seed = parse_seed(vm["seed"].as<std::string>());
  if (!seed) {
    error = "--seed must be 32 bytes of hex";
    return std::nullopt;
  }
  settings.seed = *seed;

  for (const auto& value : values_or_empty<std::string>(vm, "route")) {
    auto route = parse_route(value);
    if (!route) {
      error = fmt::format("invalid route {}", value);
      return std::nullopt;
    }
    settings.routes.push_back(std::move(*route));
  }
  if (settings.routes.empty()) {
    error = "at least one --route is required";
    return std::nullopt;
  }

  settings.options.poll_interval =
      milliseconds_of(vm, "poll-interval-ms");
  settings.options.backoff.base =
      milliseconds_of(vm, "backoff-base-ms");
  settings.options.backoff.max =
      milliseconds_of(vm, "backoff-max-ms");
  settings.options.batch_size = vm["batch-size"].as<std::size_t>();
  settings.rpc_timeout =
      milliseconds_of(vm, "rpc-timeout-ms");
  settings.db_path = vm["db-path"].as<std::string>();
  settings.log_file = vm["log-file"].as<std::string>();
  settings.verbose = vm.contains("verbose");
  return settings;
}

}  // namespace ferry::config
