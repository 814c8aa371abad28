#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <ferry/common/logging.hpp>
#include <ferry/config/options.hpp>
#include <ferry/node/chain_node.hpp>
#include <ferry/rpc/server.hpp>
#include <ferry/storage/rocksdb/storage.hpp>
#include <iostream>
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

void apply_endpoint_settings(ferry::node::chain_node& node,
                             const ferry::config::node_settings& settings) {
  const auto& admin = settings.chain.admin;
  for (const auto& relay : settings.relays) {
    auto result = node.add_relay(admin, relay);
    if (!result.ok() &&
        result.code != ferry::schema::error_code_t::relay_already_exists) {
      spdlog::error("failed to authorize relay {}: {}",
                    ferry::schema::to_hex(relay), result.log);
    }
  }
  for (const auto& remote : settings.remotes) {
    auto result =
        node.add_remote_endpoint(admin, remote.chain_id, remote.address);
    if (!result.ok()) {
      spdlog::error("failed to trust remote {} on chain {}: {}",
                    ferry::schema::to_hex(remote.address), remote.chain_id,
                    result.log);
    }
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto description = ferry::config::make_node_options();
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

  auto settings = ferry::config::make_node_settings(vm, error);
  if (!settings) {
    std::cerr << error << std::endl;
    return 1;
  }

  ferry::common::init_logging("ferryd", settings->log_file, settings->verbose);
  spdlog::info("chain {} starting as {} with storage at {}",
               settings->chain.chain_id,
               ferry::node::to_string(settings->chain.role), settings->db_path);

  auto storage = ferry::storage::make_storage<
      ferry::storage::rocksdb_storage_tag>(settings->db_path);
  auto node =
      ferry::node::chain_node{settings->chain, storage, ferry::node::system_seconds};
  apply_endpoint_settings(node, *settings);

  spdlog::info("gRPC service listening on {}", settings->listen_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = ferry::rpc::listener{node};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(settings->listen_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("failed to bind {}", settings->listen_address);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::info("chain {} stopped", settings->chain.chain_id);
  spdlog::shutdown();
  return 0;
}
