#include <csignal>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <ferry/common/logging.hpp>
#include <ferry/config/options.hpp>
#include <ferry/crypto/verify.hpp>
#include <ferry/relay/cursor_store.hpp>
#include <ferry/relay/relay_service.hpp>
#include <ferry/rpc/client.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

namespace {

using client_map_t =
    std::map<ferry::schema::chain_id_t,
             std::pair<std::string, std::unique_ptr<ferry::rpc::grpc_chain_client>>>;

ferry::rpc::grpc_chain_client* client_for(
    client_map_t& clients,
    const ferry::schema::chain_id_t chain_id,
    const std::string& target,
    const ferry::config::relay_settings& settings) {
  auto it = clients.find(chain_id);
  if (it != std::end(clients)) {
    if (it->second.first != target) {
      spdlog::error("chain {} configured at both {} and {}", chain_id,
                    it->second.first, target);
      return nullptr;
    }
    return it->second.second.get();
  }
  auto client = std::make_unique<ferry::rpc::grpc_chain_client>(
      chain_id, ferry::rpc::make_channel(target), settings.seed,
      settings.rpc_timeout);
  auto info = client->info();
  if (!info) {
    spdlog::warn("chain {} at {} is not reachable yet", chain_id, target);
  } else if (info->chain_id() != chain_id) {
    spdlog::error("{} reports chain id {}, expected {}", target,
                  info->chain_id(), chain_id);
    return nullptr;
  }
  auto* raw = client.get();
  clients.emplace(chain_id, std::pair{target, std::move(client)});
  return raw;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto description = ferry::config::make_relay_options();
  auto vm = boost::program_options::variables_map{};
  auto error = std::string{};
  if (!ferry::config::load(argc, argv, description, vm, error)) {
    std::cerr << error << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  auto settings = ferry::config::make_relay_settings(vm, error);
  if (!settings) {
    std::cerr << error << std::endl;
    return 1;
  }

  ferry::common::init_logging("ferry-relay", settings->log_file,
                              settings->verbose);

  auto identity = ferry::crypto::ed25519_public_key(settings->seed);
  if (!identity) {
    spdlog::critical("unable to derive relay identity from seed");
    spdlog::shutdown();
    return 1;
  }
  spdlog::info("relay identity {}",
               ferry::schema::to_hex(ferry::schema::bytes_view_t{
                   identity->public_key.data(), identity->public_key.size()}));

  auto storage = ferry::storage::make_storage<
      ferry::storage::rocksdb_storage_tag>(settings->db_path);
  auto cursors = ferry::relay::cursor_store{storage};
  auto service = ferry::relay::relay_service{cursors, settings->options};

  auto clients = client_map_t{};
  for (const auto& route : settings->routes) {
    auto* source = client_for(clients, route.src_chain_id, route.src_target,
                              *settings);
    auto* destination = client_for(clients, route.dst_chain_id,
                                   route.dst_target, *settings);
    if (source == nullptr || destination == nullptr) {
      spdlog::shutdown();
      return 1;
    }
    service.add_route(*source, *destination);
  }

  service.start();
  while (!shutdown_requested()) {
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  service.stop();
  service.join();

  spdlog::info("relay stopped");
  spdlog::shutdown();
  return 0;
}
