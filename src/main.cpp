#include <csignal>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <rxseal/common/clock.hpp>
#include <rxseal/crypto/verify.hpp>
#include <rxseal/ledger/engine.hpp>
#include <rxseal/ledger/server.hpp>
#include <rxseal/schema/encoding/scale/encoder.hpp>
#include <rxseal/storage/rocksdb/storage.hpp>
#include <atomic>
#include <iostream>
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

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto listen = std::string{};
  auto db_path = std::string{};
  auto owner_hex = std::string{};
  auto log_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"rxseal-ledgerd"};
  description.add_options()("help,h", "Show the help message")(
      "listen,l",
      boost::program_options::value<std::string>(&listen)
          ->default_value("0.0.0.0:8545"),
      "IP:Port for the ledger gRPC service")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)
          ->default_value("rxseal-ledger"),
      "RocksDB directory for ledger state")(
      "owner,o", boost::program_options::value<std::string>(&owner_hex),
      "Owner account id (hex); required on first start")(
      "log-file",
      boost::program_options::value<std::string>(&log_file)
          ->default_value("rxseal-ledgerd.log"),
      "Log file path")("verbose,v", "Enable verbose output");
  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << '\n' << description << std::endl;
    return 2;
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
      "ledger", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  auto owner = rxseal::schema::make_zero_hash();
  if (!owner_hex.empty()) {
    auto parsed = rxseal::schema::try_make_hash32(owner_hex);
    if (!parsed) {
      spdlog::error("--owner must be a 32 byte hex account id");
      spdlog::shutdown();
      return 2;
    }
    owner = *parsed;
  }

  if (!rxseal::crypto::available()) {
    spdlog::error("OpenSSL build lacks ed25519; refusing to start");
    spdlog::shutdown();
    return 1;
  }

  auto encoder = rxseal::schema::encoding::scale_encoder_t{};
  auto storage =
      rxseal::storage::make_storage<rxseal::storage::rocksdb_storage_tag>(
          db_path);
  auto ledger = rxseal::ledger::engine{encoder, storage, owner,
                                       rxseal::common::system_unix_clock()};
  spdlog::info("Ledger gRPC service listening on {}", listen);

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = rxseal::ledger::listener{ledger};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(listen, grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    spdlog::error("Failed to start gRPC server on {}", listen);
    spdlog::shutdown();
    return 1;
  }
  grpc_server->GetHealthCheckService()->SetServingStatus(true);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
    spdlog::info("Shutting down at height {}", ledger.height());
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
