#include <rxseal/config/config.hpp>

#include <cstdint>

namespace po = boost::program_options;

namespace rxseal::config {

po::options_description make_ledger_options() {
  auto options = po::options_description{"Ledger"};
  options.add_options()(
      "ledger-rpc",
      po::value<std::string>()->default_value(
          std::string{kDefaultLedgerEndpoint}),
      "ledger gRPC endpoint, host:port (env RXSEAL_LEDGER_RPC)")(
      "ledger-timeout-ms",
      po::value<uint64_t>()->default_value(
          static_cast<uint64_t>(rxseal::ledger::kDefaultLedgerTimeout.count())),
      "per-call ledger deadline in ms (env RXSEAL_LEDGER_TIMEOUT_MS)");
  return options;
}

std::string map_environment_name(const std::string& variable) {
  if (variable == kLedgerEndpointVariable) {
    return "ledger-rpc";
  }
  if (variable == kLedgerTimeoutVariable) {
    return "ledger-timeout-ms";
  }
  return {};
}

void store_environment(const po::options_description& options,
                       po::variables_map& vm) {
  po::store(po::parse_environment(options, map_environment_name), vm);
}

std::optional<ledger_config> try_make_ledger_config(const po::variables_map& vm,
                                                    std::string& error) {
  auto config = ledger_config{};
  if (vm.contains("ledger-rpc")) {
    config.endpoint = vm["ledger-rpc"].as<std::string>();
  }
  if (vm.contains("ledger-timeout-ms")) {
    config.timeout =
        std::chrono::milliseconds{vm["ledger-timeout-ms"].as<uint64_t>()};
  }
  if (config.endpoint.empty()) {
    error = "ledger endpoint must not be empty";
    return std::nullopt;
  }
  if (config.timeout.count() <= 0) {
    error = "ledger timeout must be positive";
    return std::nullopt;
  }
  return config;
}

}  // namespace rxseal::config
