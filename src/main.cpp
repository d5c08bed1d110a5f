#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <sentinel/abci/server.hpp>
#include <sentinel/crypto/verify.hpp>
#include <sentinel/execution/engine.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <atomic>
#include <chrono>
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

std::optional<sentinel::schema::account_id_t> parse_account(
    const std::string& option,
    const std::string& value) {
  auto account = sentinel::schema::try_make_account_id(value);
  if (!account) {
    spdlog::error("--{} expects a 20 byte hex account, got '{}'", option,
                  value);
  }
  return account;
}

std::optional<sentinel::schema::amount_t> parse_amount(
    const std::string& option,
    const std::string& value) {
  auto amount = sentinel::schema::try_make_amount(value);
  if (!amount) {
    spdlog::error("--{} expects a decimal amount, got '{}'", option, value);
  }
  return amount;
}

// account=amount
std::optional<std::pair<sentinel::schema::account_id_t,
                        sentinel::schema::amount_t>>
parse_balance(const std::string& value) {
  auto separator = value.find('=');
  if (separator == std::string::npos) {
    spdlog::error("--genesis-balance expects account=amount, got '{}'", value);
    return std::nullopt;
  }
  auto account = parse_account("genesis-balance", value.substr(0, separator));
  auto amount = parse_amount("genesis-balance", value.substr(separator + 1));
  if (!account || !amount) {
    return std::nullopt;
  }
  return std::pair{*account, *amount};
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto owner = std::string{};
  auto auditor = std::string{};
  auto minimum_fee = std::string{};
  auto genesis = sentinel::schema::genesis_t{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Sentinel"};
  description.add_options()("help,h", "Show the help message")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:26658"),
      "IP:Port for the ABCI server")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "sentinel.db"),
      "RocksDB state directory")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "sentinel.log"),
      "Log file path")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)->default_value(
          "info"),
      "trace|debug|info|warn|error|critical")(
      "verbose,v", "Enable verbose output (debug log level)")(
      "strict-crypto",
      boost::program_options::value<bool>()->default_value(true),
      "Verify transaction signatures")(
      "owner", boost::program_options::value<std::string>(&owner),
      "Genesis owner account hex")(
      "auditor", boost::program_options::value<std::string>(&auditor),
      "Genesis auditor account hex")(
      "auditor-name",
      boost::program_options::value<std::string>(&genesis.auditor_name)
          ->default_value("sentinel"),
      "Registry name of the genesis auditor")(
      "minimum-fee",
      boost::program_options::value<std::string>(&minimum_fee)
          ->default_value(sentinel::schema::kDefaultMinimumFeeDecimal),
      "Minimum audit fee in base units")(
      "refund-timeout-ms",
      boost::program_options::value<uint64_t>(&genesis.refund_timeout)
          ->default_value(sentinel::schema::kDefaultRefundTimeout),
      "Delay before a pending request may be refunded")(
      "report-cooldown-ms",
      boost::program_options::value<uint64_t>(&genesis.report_cooldown)
          ->default_value(sentinel::schema::kDefaultReportCooldown),
      "Minimum delay between reports from one auditor")(
      "genesis-balance",
      boost::program_options::value<std::vector<std::string>>()->composing(),
      "Opening balance as account=amount (repeatable)")(
      "fee-exempt",
      boost::program_options::value<std::vector<std::string>>()->composing(),
      "Target account exempt from the minimum fee (repeatable)");
  boost::program_options::store(
      boost::program_options::parse_command_line(argc, argv, description), vm);
  boost::program_options::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "sentinel", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose")
                        ? spdlog::level::debug
                        : spdlog::level::from_str(log_level));

  auto genesis_owner = parse_account("owner", owner);
  auto genesis_auditor = parse_account("auditor", auditor);
  auto genesis_fee = parse_amount("minimum-fee", minimum_fee);
  if (!genesis_owner || !genesis_auditor || !genesis_fee) {
    spdlog::shutdown();
    return 1;
  }
  genesis.owner = *genesis_owner;
  genesis.auditor = *genesis_auditor;
  genesis.minimum_fee = *genesis_fee;
  if (vm.contains("genesis-balance")) {
    for (const auto& value :
         vm["genesis-balance"].as<std::vector<std::string>>()) {
      auto balance = parse_balance(value);
      if (!balance) {
        spdlog::shutdown();
        return 1;
      }
      genesis.balances.push_back(*balance);
    }
  }
  if (vm.contains("fee-exempt")) {
    for (const auto& value : vm["fee-exempt"].as<std::vector<std::string>>()) {
      auto target = parse_account("fee-exempt", value);
      if (!target) {
        spdlog::shutdown();
        return 1;
      }
      genesis.fee_exempt_targets.push_back(*target);
    }
  }

  auto strict_crypto = vm["strict-crypto"].as<bool>();
  if (strict_crypto && !sentinel::crypto::available()) {
    spdlog::critical(
        "strict crypto requested but OpenSSL lacks ed25519/secp256k1");
    spdlog::shutdown();
    return 1;
  }

  spdlog::info("Opening state at {}", db_path);
  auto storage = sentinel::storage::make_storage<
      sentinel::storage::rocksdb_storage_tag>(db_path);
  auto encoder = sentinel::schema::encoding::encoder<
      sentinel::schema::encoding::scale_encoder_tag>{};
  auto engine =
      sentinel::execution::engine{encoder, storage, strict_crypto};

  spdlog::info("gRPC service listening on {}", grpc_address);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = sentinel::abci::listener{engine, genesis};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::critical("Failed to start gRPC server on {}", grpc_address);
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
