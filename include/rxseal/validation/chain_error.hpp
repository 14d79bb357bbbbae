#pragma once

#include <rxseal/schema/chain_error_code.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rxseal::validation {

/// Ordered key/value diagnostics for audit logging.
using context_t = std::vector<std::pair<std::string, std::string>>;

/// Typed rejection produced by the validation gate.
struct chain_validation_error final {
  rxseal::schema::chain_error_code code{};
  std::string message;
  context_t context;

  std::optional<std::string_view> find(std::string_view key) const;
};

/// 503 for CHAIN_UNREACHABLE, 403 for every other code.
constexpr uint16_t http_status(const rxseal::schema::chain_error_code code) {
  return code == rxseal::schema::chain_error_code::chain_unreachable ? 503
                                                                     : 403;
}

/// Only an unreachable ledger is worth retrying without new input.
constexpr bool is_retryable(const rxseal::schema::chain_error_code code) {
  return code == rxseal::schema::chain_error_code::chain_unreachable;
}

/// Operational reason shown to the requesting user, e.g. "already dispensed".
std::string user_reason(const chain_validation_error& error);

/// `key=value` pairs separated by spaces.
std::string format_context(const context_t& context);

}  // namespace rxseal::validation
