#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <notary/common/critical.hpp>
#include <notary/execution/engine.hpp>
#include <notary/execution/payment_rail.hpp>
#include <notary/rpc/server.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

namespace {

notary::schema::address_t require_address(const std::string& option,
                                          const std::string& value) {
  auto address = notary::schema::try_make_address(value);
  if (!address) {
    notary::common::critical("--{} is not a 20-byte hex address: '{}'", option,
                             value);
  }
  return *address;
}

std::optional<notary::schema::address_t> optional_address(
    const po::variables_map& vm,
    const std::string& option) {
  if (!vm.contains(option)) {
    return std::nullopt;
  }
  return require_address(option, vm[option].as<std::string>());
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto chain_id = std::string{};
  auto registry_address = std::string{};
  auto owner = std::string{};
  auto tip_amount = std::string{};
  auto strict_crypto = true;
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto config_file = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Notary"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "INI file with any of the options below")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:26658"),
      "IP:Port for the ledger gRPC service")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("notary.db"),
      "RocksDB directory")(
      "chain-id",
      po::value<std::string>(&chain_id)->default_value(
          std::string(64, '0')),
      "32-byte hex chain id bound into every signature")(
      "registry-address",
      po::value<std::string>(&registry_address)
          ->default_value(std::string(40, '0')),
      "20-byte hex address of this registry instance")(
      "owner", po::value<std::string>(&owner),
      "Genesis owner address (required on first start)")(
      "overrider", po::value<std::string>(),
      "Genesis overrider address (default: none)")(
      "tip-jar", po::value<std::string>(),
      "Genesis tip jar address (default: owner)")(
      "tip-amount",
      po::value<std::string>(&tip_amount)->default_value("0"),
      "Genesis minimum tip for publishing an assertion")(
      "strict-crypto", po::value<bool>(&strict_crypto)->default_value(true),
      "Verify envelope signatures")(
      "log-level",
      po::value<std::string>(&log_level)->default_value("info"),
      "trace, debug, info, warn, error or critical")(
      "log-file",
      po::value<std::string>(&log_file)->default_value("notary.log"),
      "Log file path");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto config_path = vm["config"].as<std::string>();
      auto config_stream = std::ifstream{config_path};
      if (!config_stream) {
        std::cerr << "cannot open config file " << config_path << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(config_stream, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "notary", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(log_level));

  auto genesis = notary::execution::genesis_config{};
  auto parsed_chain_id = notary::schema::try_make_hash32(chain_id);
  if (!parsed_chain_id) {
    notary::common::critical("--chain-id is not a 32-byte hex value: '{}'",
                             chain_id);
  }
  genesis.chain_id = *parsed_chain_id;
  genesis.registry_address =
      require_address("registry-address", registry_address);
  if (!owner.empty()) {
    genesis.owner = require_address("owner", owner);
  }
  genesis.overrider = optional_address(vm, "overrider");
  genesis.tip_jar = optional_address(vm, "tip-jar");
  auto parsed_tip_amount = notary::schema::try_parse_amount(tip_amount);
  if (!parsed_tip_amount) {
    notary::common::critical("--tip-amount is not a decimal amount: '{}'",
                             tip_amount);
  }
  genesis.tip_amount = *parsed_tip_amount;

  auto encoder = notary::execution::encoder_t{};
  auto storage = notary::storage::make_storage<
      notary::storage::rocksdb_storage_tag>(db_path);
  auto rail = notary::execution::logging_payment_rail{};
  auto engine = notary::execution::engine{encoder, storage, genesis, rail,
                                          strict_crypto};

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = notary::rpc::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    notary::common::critical("failed to start gRPC server on {}",
                             grpc_address);
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

  spdlog::info("Shut down");
  spdlog::shutdown();
  return 0;
}
