#pragma once

#include <rxseal/canonical/snapshot.hpp>
#include <rxseal/common/clock.hpp>
#include <rxseal/ledger/client.hpp>
#include <rxseal/schema/prescription_record.hpp>
#include <rxseal/validation/chain_error.hpp>

#include <chrono>
#include <string>
#include <variant>

namespace rxseal::validation {

struct gate_options final {
  /// Ledger endpoint label, reported as `rpcUrl` in error context.
  std::string endpoint;
  std::chrono::milliseconds timeout{rxseal::ledger::kDefaultLedgerTimeout};
};

struct hash_integrity final {
  bool patient_match{};
  bool medication_match{};
};

struct validation_success final {
  rxseal::schema::prescription_record_t record;
  hash_integrity integrity;
};

using validation_outcome_t =
    std::variant<validation_success, chain_validation_error>;

/// Pre-mutation check of an off-chain prescription against the ledger.
///
/// Checks run in a fixed order and stop at the first failure:
/// connectivity, existence, status, usage, expiry, hash integrity. The gate
/// only reads; it never retries and never changes ledger or off-chain state.
class gate final {
 public:
  gate(rxseal::ledger::client& ledger,
       gate_options options,
       rxseal::common::unix_clock_t clock);

  validation_outcome_t validate(const rxseal::schema::prescription_id_t& id,
                                const rxseal::canonical::snapshot& snapshot)
      const;

  const gate_options& options() const { return options_; }

 private:
  chain_validation_error reject(rxseal::schema::chain_error_code code,
                                std::string message,
                                const rxseal::schema::prescription_id_t& id,
                                context_t context) const;

  rxseal::ledger::client& ledger_;
  gate_options options_;
  rxseal::common::unix_clock_t clock_;
};

inline bool is_valid(const validation_outcome_t& outcome) {
  return std::holds_alternative<validation_success>(outcome);
}

}  // namespace rxseal::validation
