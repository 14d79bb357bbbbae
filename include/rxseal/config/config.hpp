#pragma once

#include <rxseal/ledger/client.hpp>

#include <boost/program_options.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace rxseal::config {

inline constexpr auto kDefaultLedgerEndpoint =
    std::string_view{"127.0.0.1:8545"};
inline constexpr auto kLedgerEndpointVariable =
    std::string_view{"RXSEAL_LEDGER_RPC"};
inline constexpr auto kLedgerTimeoutVariable =
    std::string_view{"RXSEAL_LEDGER_TIMEOUT_MS"};

struct ledger_config final {
  std::string endpoint{kDefaultLedgerEndpoint};
  std::chrono::milliseconds timeout{rxseal::ledger::kDefaultLedgerTimeout};
};

/// `--ledger-rpc` and `--ledger-timeout-ms`, with their defaults.
boost::program_options::options_description make_ledger_options();

/// Option name for a ledger environment variable, or empty to ignore it.
std::string map_environment_name(const std::string& variable);

/// Store values from the process environment. Call after the command line
/// has been stored so explicit flags take precedence.
void store_environment(
    const boost::program_options::options_description& options,
    boost::program_options::variables_map& vm);

/// Read and validate the ledger settings. Fails on an empty endpoint or a
/// zero timeout.
std::optional<ledger_config> try_make_ledger_config(
    const boost::program_options::variables_map& vm,
    std::string& error);

}  // namespace rxseal::config
