#pragma once

#include <rxseal/common/clock.hpp>
#include <rxseal/schema/encoding/scale/encoder.hpp>
#include <rxseal/schema/ledger_call.hpp>
#include <rxseal/schema/ledger_error_code.hpp>
#include <rxseal/schema/ledger_event_record.hpp>
#include <rxseal/schema/ledger_receipt.hpp>
#include <rxseal/schema/prescription_record.hpp>
#include <rxseal/schema/primitives.hpp>
#include <rxseal/schema/query_result.hpp>
#include <rxseal/schema/role_id.hpp>
#include <rxseal/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string_view>
#include <utility>
#include <vector>

namespace rxseal::ledger {

inline constexpr auto kLedgerCodespace = std::string_view{"rxseal.ledger"};
inline constexpr auto kQueryCodespace = std::string_view{"rxseal.query"};

using signature_verifier_t =
    std::function<bool(const rxseal::schema::bytes_view_t&,
                       const rxseal::schema::ed25519_public_key_t&,
                       const rxseal::schema::ed25519_signature_t&)>;

/// Prescription ledger state machine.
///
/// Holds role membership, prescription records, per-signer nonces and the
/// event log in RocksDB. Every accepted call is applied in one write batch
/// under a single mutex, so concurrent dispense attempts for the same record
/// are serialized here and the second one observes the first one's effect.
class engine final {
 public:
  /// `owner` is used only on first start; afterwards the persisted owner wins.
  /// `require_strict_crypto` enables signature verification; when false,
  /// signatures are accepted unchecked but nonces are still enforced.
  explicit engine(
      rxseal::schema::encoding::scale_encoder_t& encoder,
      rxseal::storage::rocksdb_storage_t& storage,
      const rxseal::schema::account_id_t& owner,
      rxseal::common::unix_clock_t clock,
      bool require_strict_crypto = true);

  /// Decode and apply a SCALE encoded ledger call.
  rxseal::schema::ledger_receipt_t submit(
      const rxseal::schema::bytes_view_t& raw_call);

  /// Validate envelope, signature and nonce, then execute the payload.
  ///
  /// Code 0 means the operation took effect. A dispense attempt past expiry
  /// returns `prescription_expired` and still commits the EXPIRED transition.
  rxseal::schema::ledger_receipt_t submit(
      const rxseal::schema::ledger_call_t& call);

  /// Read-path query by route. See engine.cpp for the route table.
  rxseal::schema::query_result_t query(
      std::string_view path,
      const rxseal::schema::bytes_view_t& data) const;

  /// Record for `id`, or a zero record (zero id) when unknown.
  rxseal::schema::prescription_record_t get_prescription(
      const rxseal::schema::prescription_id_t& id) const;

  bool has_role(rxseal::schema::role_id_t role,
                const rxseal::schema::account_id_t& account) const;

  /// Nonce the next call from `account` must carry.
  uint64_t next_nonce(const rxseal::schema::account_id_t& account) const;

  /// Returns (patient_match, medication_match). Both false for unknown ids.
  std::pair<bool, bool> verify_prescription_hash(
      const rxseal::schema::prescription_id_t& id,
      const rxseal::schema::hash32_t& patient_hash,
      const rxseal::schema::hash32_t& medication_hash) const;

  bool verify_patient_ownership(
      const rxseal::schema::prescription_id_t& id,
      const rxseal::schema::hash32_t& commitment) const;

  /// Event log entries with ids in [from_id, to_id].
  std::vector<rxseal::schema::ledger_event_record_t> events(
      uint64_t from_id,
      uint64_t to_id) const;

  rxseal::schema::account_id_t owner() const;

  /// Number of committed calls.
  uint64_t height() const;

  /// Install runtime signature verifier callback.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  struct execution;

  rxseal::schema::ledger_receipt_t validate_call(
      const rxseal::schema::ledger_call_t& call,
      const rxseal::schema::account_id_t& caller) const;
  rxseal::schema::ledger_receipt_t commit(
      const rxseal::schema::ledger_call_t& call,
      const rxseal::schema::account_id_t& caller,
      execution&& result);

  void execute(const rxseal::schema::register_doctor_t& operation,
               const rxseal::schema::account_id_t& caller,
               execution& result) const;
  void execute(const rxseal::schema::register_pharmacy_t& operation,
               const rxseal::schema::account_id_t& caller,
               execution& result) const;
  void execute(const rxseal::schema::issue_prescription_t& operation,
               const rxseal::schema::account_id_t& caller,
               execution& result) const;
  void execute(const rxseal::schema::dispense_prescription_t& operation,
               const rxseal::schema::account_id_t& caller,
               execution& result) const;
  void execute(const rxseal::schema::set_patient_commitment_t& operation,
               const rxseal::schema::account_id_t& caller,
               execution& result) const;

  void grant_role(rxseal::schema::role_id_t role,
                  const rxseal::schema::account_id_t& account,
                  const rxseal::schema::account_id_t& caller,
                  execution& result) const;

  rxseal::schema::prescription_record_t load_prescription(
      const rxseal::schema::prescription_id_t& id) const;
  bool load_role(rxseal::schema::role_id_t role,
                 const rxseal::schema::account_id_t& account) const;
  uint64_t load_nonce(const rxseal::schema::account_id_t& account) const;
  void load_persisted_state(const rxseal::schema::account_id_t& owner);

  mutable std::mutex mutex_;
  rxseal::schema::encoding::scale_encoder_t& encoder_;
  rxseal::storage::rocksdb_storage_t& storage_;
  rxseal::common::unix_clock_t clock_;
  rxseal::schema::account_id_t owner_{};
  uint64_t height_{};
  uint64_t event_sequence_{};
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
};

}  // namespace rxseal::ledger
