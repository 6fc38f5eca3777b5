#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <explorer/index/indexer.hpp>
#include <explorer/query/resolver.hpp>
#include <explorer/query/tip_channel.hpp>
#include <explorer/rpc/server.hpp>
#include <explorer/storage/entity_store.hpp>
#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

namespace {

std::optional<explorer::schema::non_zero_t> non_zero_fee(const uint64_t value) {
  if (value == 0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto config_file = std::string{};
  auto epoch_stability_depth = uint32_t{};
  auto retention_window = uint32_t{};
  auto max_page_size = uint64_t{};
  auto max_orphans = std::size_t{};
  auto storage_options = explorer::storage::storage_options{};
  auto db_cache_mb = std::size_t{};
  auto fees = explorer::schema::fee_settings{};
  auto pool_registration_fee = uint64_t{};
  auto stake_delegation_fee = uint64_t{};
  auto owner_stake_delegation_fee = uint64_t{};
  auto vote_plan_fee = uint64_t{};
  auto vote_cast_fee = uint64_t{};
  auto query_threads = std::size_t{};

  namespace po = boost::program_options;
  auto vm = po::variables_map{};
  auto description = po::options_description{"Explorer"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_file),
      "Read options from an INI style config file")(
      "grpc-address,g",
      po::value<std::string>(&grpc_address)->default_value("0.0.0.0:50051"),
      "IP:Port for the explorer gRPC service")(
      "db-path,d",
      po::value<std::string>(&db_path)->default_value("explorer-db"),
      "RocksDB directory")(
      "db-sync-writes",
      po::bool_switch(&storage_options.sync_writes)->default_value(false),
      "fsync the RocksDB write-ahead log on every write")(
      "db-cache-mb", po::value<std::size_t>(&db_cache_mb)->default_value(64),
      "RocksDB block cache size in MiB")(
      "epoch-stability-depth",
      po::value<uint32_t>(&epoch_stability_depth)->default_value(10),
      "Blocks a tip must sit above a block before it is confirmed")(
      "retention-window", po::value<uint32_t>(&retention_window),
      "Blocks a fork may trail main before it is retired (default: epoch "
      "stability depth)")(
      "max-page-size",
      po::value<uint64_t>(&max_page_size)->default_value(100),
      "Largest page a connection returns")(
      "query-threads",
      po::value<std::size_t>(&query_threads)->default_value(4),
      "Worker threads resolving Query calls")(
      "max-orphans",
      po::value<std::size_t>(&max_orphans)->default_value(1024),
      "Out of order blocks buffered while their parent is missing")(
      "fee-constant", po::value<uint64_t>(&fees.constant)->default_value(0),
      "Constant fee")(
      "fee-coefficient",
      po::value<uint64_t>(&fees.coefficient)->default_value(0),
      "Per input/output fee coefficient")(
      "fee-certificate",
      po::value<uint64_t>(&fees.certificate)->default_value(0),
      "Default certificate fee")(
      "fee-pool-registration",
      po::value<uint64_t>(&pool_registration_fee)->default_value(0),
      "Pool registration fee override (0 = none)")(
      "fee-stake-delegation",
      po::value<uint64_t>(&stake_delegation_fee)->default_value(0),
      "Stake delegation fee override (0 = none)")(
      "fee-owner-stake-delegation",
      po::value<uint64_t>(&owner_stake_delegation_fee)->default_value(0),
      "Owner stake delegation fee override (0 = none)")(
      "fee-vote-plan",
      po::value<uint64_t>(&vote_plan_fee)->default_value(0),
      "Vote plan fee override (0 = none)")(
      "fee-vote-cast",
      po::value<uint64_t>(&vote_cast_fee)->default_value(0),
      "Vote cast fee override (0 = none)")(
      "log-file,l",
      po::value<std::string>(&log_file)->default_value("explorer.log"),
      "Log file path")("verbose,v", "Enable verbose output");
  po::store(po::parse_command_line(argc, argv, description), vm);
  if (vm.contains("config")) {
    auto config = std::ifstream{vm["config"].as<std::string>()};
    if (!config) {
      std::cerr << "cannot open config file " << vm["config"].as<std::string>()
                << std::endl;
      return 1;
    }
    po::store(po::parse_config_file(config, description), vm);
  }
  po::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "explorer", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  fees.per_certificate.pool_registration = non_zero_fee(pool_registration_fee);
  fees.per_certificate.stake_delegation = non_zero_fee(stake_delegation_fee);
  fees.per_certificate.owner_stake_delegation =
      non_zero_fee(owner_stake_delegation_fee);
  fees.per_vote_certificate.vote_plan = non_zero_fee(vote_plan_fee);
  fees.per_vote_certificate.vote_cast = non_zero_fee(vote_cast_fee);

  auto options = explorer::index::indexer_options{
      .epoch_stability_depth = epoch_stability_depth,
      .retention_window = vm.contains("retention-window")
                              ? std::optional<uint32_t>{retention_window}
                              : std::nullopt,
      .max_orphans = max_orphans};
  auto settings = explorer::schema::settings_t{
      .fees = fees, .epoch_stability_depth = epoch_stability_depth};

  storage_options.block_cache_bytes = db_cache_mb << 20u;
  spdlog::info("Opening entity store at '{}'", db_path);
  auto store = explorer::storage::entity_store{db_path, storage_options};
  auto indexer = explorer::index::indexer{store, options};
  auto tips = explorer::query::tip_channel{};
  indexer.set_tip_listener(
      [&](const explorer::schema::branch_view& tip) { tips.publish(tip); });
  indexer.recover();
  auto resolver = explorer::query::resolver{indexer, settings, max_page_size};

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = explorer::rpc::listener{indexer, resolver, tips,
                                                query_threads};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC service on {}", grpc_address);
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
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
