#pragma once

#include <rxseal/schema/encoding/scale/encoder.hpp>
#include <rxseal/schema/offchain_record.hpp>
#include <rxseal/schema/offchain_status.hpp>
#include <rxseal/schema/security_event_record.hpp>
#include <rxseal/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rxseal::offchain {

inline constexpr auto kRecordPrefix = std::string_view{"RX|OFFCHAIN|RECORD|"};
inline constexpr auto kSecurityEventPrefix =
    std::string_view{"RX|OFFCHAIN|SECURITY|"};
inline constexpr auto kSecurityEventSequenceKey =
    std::string_view{"RX|OFFCHAIN|SYS|SECURITY_SEQUENCE"};

using record_mutation_t =
    std::function<void(rxseal::schema::offchain_record_t&)>;

/// Off-chain prescription metadata and the security event log.
///
/// Records are keyed by short code. Status moves go through `transition`,
/// which checks is_valid_transition under the store mutex, so two callers
/// racing on the same record cannot both leave ACTIVE.
class record_store final {
 public:
  record_store(rxseal::schema::encoding::scale_encoder_t& encoder,
               rxseal::storage::rocksdb_storage_t& storage);

  /// Fails for an invalid or already used short code.
  bool insert(const rxseal::schema::offchain_record_t& record,
              std::string& error);

  std::optional<rxseal::schema::offchain_record_t> find(
      std::string_view short_code) const;

  /// All records in short code order.
  std::vector<rxseal::schema::offchain_record_t> list() const;

  /// Move the record to `to` and apply `mutate` in the same write. Returns the
  /// stored record, or std::nullopt with `error` set when the record is
  /// missing or the move is not allowed.
  std::optional<rxseal::schema::offchain_record_t> transition(
      std::string_view short_code,
      rxseal::schema::offchain_status_t to,
      const record_mutation_t& mutate,
      std::string& error);

  /// Edit fields that are not part of the canonical snapshot. Changes to the
  /// short code, doctor, patient identity, medicine name, dosage or quantity,
  /// or status are refused.
  std::optional<rxseal::schema::offchain_record_t> update(
      std::string_view short_code,
      const record_mutation_t& mutate,
      std::string& error);

  /// Assigns the next event id and persists the event. Returns the id.
  uint64_t record_security_event(rxseal::schema::security_event_record_t event);

  std::vector<rxseal::schema::security_event_record_t> security_events() const;

 private:
  std::optional<rxseal::schema::offchain_record_t> load(
      std::string_view short_code) const;
  void store(const rxseal::schema::offchain_record_t& record) const;

  mutable std::mutex mutex_;
  rxseal::schema::encoding::scale_encoder_t& encoder_;
  rxseal::storage::rocksdb_storage_t& storage_;
};

rxseal::schema::bytes_t make_record_key(std::string_view short_code);
rxseal::schema::bytes_t make_security_event_key(uint64_t event_id);

}  // namespace rxseal::offchain
