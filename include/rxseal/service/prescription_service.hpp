#pragma once

#include <rxseal/common/clock.hpp>
#include <rxseal/crypto/signing_key.hpp>
#include <rxseal/ledger/client.hpp>
#include <rxseal/offchain/record_store.hpp>
#include <rxseal/schema/ledger_receipt.hpp>
#include <rxseal/schema/medicine_entry.hpp>
#include <rxseal/schema/offchain_record.hpp>
#include <rxseal/validation/gate.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rxseal::service {

enum class service_error_code : uint8_t {
  malformed_input = 1,
  not_found = 2,
  invalid_state = 3,
  validation_rejected = 4,
  ledger_unreachable = 5,
  ledger_refused = 6,
  store_failure = 7,
};

struct service_error final {
  service_error_code code{};
  uint16_t http_status{};
  std::string message;
  /// Set when the validation gate rejected the request.
  std::optional<rxseal::validation::chain_validation_error> chain_error;
  /// Set when the ledger answered with a non-zero code.
  std::optional<rxseal::schema::ledger_receipt_t> receipt;
};

struct issue_request final {
  /// Empty to generate one from the patient details and issue time.
  std::string short_code;
  std::string patient_name;
  std::string patient_age;
  std::vector<rxseal::schema::medicine_entry_t> medicines;
  std::string notes;
  uint32_t max_usage{1};
  rxseal::schema::timestamp_seconds_t expiry_date{};
};

struct mutation_result final {
  rxseal::schema::offchain_record_t record;
  rxseal::schema::ledger_receipt_t receipt;
};

template <typename T>
using result_t = std::variant<T, service_error>;

enum class reconciliation_state : uint8_t {
  matched = 0,
  mismatched = 1,
  not_on_ledger = 2,
  unreachable = 3,
};

struct reconciliation_entry final {
  std::string short_code;
  reconciliation_state state{};
  rxseal::validation::hash_integrity integrity;
  std::string detail;
};

struct reconciliation_report final {
  std::size_t matched{};
  std::size_t mismatched{};
  std::size_t not_on_ledger{};
  std::size_t unreachable{};
  std::vector<reconciliation_entry> entries;
};

/// Issue and dispense flows over the ledger and the off-chain store.
///
/// Issuance writes the ledger first and the off-chain record only after a
/// successful receipt. Dispense runs the validation gate before touching
/// either side and reserves the record as PENDING_DISPENSE while the ledger
/// call is in flight.
class prescription_service final {
 public:
  prescription_service(rxseal::ledger::client& ledger,
                       rxseal::offchain::record_store& records,
                       rxseal::validation::gate_options options,
                       rxseal::common::unix_clock_t clock);

  result_t<mutation_result> issue(const issue_request& request,
                                  const rxseal::crypto::signing_key& doctor);

  result_t<mutation_result> dispense(
      std::string_view short_code,
      const rxseal::crypto::signing_key& pharmacy);

  /// Run the gate without mutating anything.
  result_t<rxseal::validation::validation_success> verify(
      std::string_view short_code);

  /// Compare every off-chain record with the ledger. Only `hash_verified` is
  /// written back; mismatches are reported and logged, never repaired.
  reconciliation_report reconcile();

  /// Settle a record left in PENDING_DISPENSE by an interrupted dispense.
  /// The ledger usage count decides: a higher count commits the dispense,
  /// otherwise the reservation is released to its prior status (EXPIRED when
  /// the ledger has expired the prescription).
  result_t<rxseal::schema::offchain_record_t> resolve_pending(
      std::string_view short_code);

  /// Move ACTIVE and DISPENSED records past expiry to EXPIRED. Returns the
  /// number of records moved.
  std::size_t sweep_expired(rxseal::schema::timestamp_seconds_t now);

 private:
  void record_security_event(rxseal::schema::security_event_type_t type,
                             rxseal::schema::security_event_severity_t severity,
                             std::string code,
                             std::string short_code,
                             std::string message,
                             rxseal::validation::context_t context);
  service_error reject_validation(
      const rxseal::schema::offchain_record_t& record,
      rxseal::validation::chain_validation_error error);
  service_error reject_receipt(std::string_view short_code,
                               std::string_view operation,
                               rxseal::schema::ledger_receipt_t receipt);

  rxseal::ledger::client& ledger_;
  rxseal::offchain::record_store& records_;
  rxseal::validation::gate gate_;
  rxseal::validation::gate_options options_;
  rxseal::common::unix_clock_t clock_;
};

std::string_view to_string(service_error_code code);
std::string_view to_string(reconciliation_state state);

}  // namespace rxseal::service
