#pragma once

#include <rxseal/crypto/signing_key.hpp>
#include <rxseal/schema/ledger_call.hpp>
#include <rxseal/schema/ledger_event_record.hpp>
#include <rxseal/schema/ledger_receipt.hpp>
#include <rxseal/schema/prescription_record.hpp>
#include <rxseal/schema/primitives.hpp>
#include <rxseal/schema/query_result.hpp>
#include <rxseal/schema/role_id.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace rxseal::ledger {

inline constexpr auto kTransportCodespace =
    std::string_view{"rxseal.transport"};
inline constexpr auto kDefaultLedgerTimeout = std::chrono::milliseconds{5000};

/// Query/submit access to a ledger.
///
/// Every call is bounded by `timeout`. Transport failures are reported, never
/// retried: `ping` and `query` return false/std::nullopt with `error` set, and
/// `submit` returns a receipt with code `transport_failure` in the
/// `rxseal.transport` codespace.
class client {
 public:
  virtual ~client() = default;

  /// Liveness probe.
  virtual bool ping(std::chrono::milliseconds timeout, std::string& error) = 0;

  virtual std::optional<rxseal::schema::query_result_t> query(
      std::string_view path,
      const rxseal::schema::bytes_view_t& data,
      std::chrono::milliseconds timeout,
      std::string& error) = 0;

  virtual rxseal::schema::ledger_receipt_t submit(
      const rxseal::schema::ledger_call_t& call,
      std::chrono::milliseconds timeout) = 0;
};

rxseal::schema::ledger_receipt_t make_transport_failure(std::string message);

/// Fetch a record. std::nullopt means the ledger could not be read; a record
/// with a zero id means the ledger has no such prescription.
std::optional<rxseal::schema::prescription_record_t> fetch_prescription(
    client& ledger,
    const rxseal::schema::prescription_id_t& id,
    std::chrono::milliseconds timeout,
    std::string& error);

std::optional<uint64_t> fetch_next_nonce(
    client& ledger,
    const rxseal::schema::account_id_t& account,
    std::chrono::milliseconds timeout,
    std::string& error);

std::optional<bool> fetch_role(client& ledger,
                               rxseal::schema::role_id_t role,
                               const rxseal::schema::account_id_t& account,
                               std::chrono::milliseconds timeout,
                               std::string& error);

/// Returns (patient_match, medication_match).
std::optional<std::pair<bool, bool>> fetch_hash_verification(
    client& ledger,
    const rxseal::schema::prescription_id_t& id,
    const rxseal::schema::hash32_t& patient_hash,
    const rxseal::schema::hash32_t& medication_hash,
    std::chrono::milliseconds timeout,
    std::string& error);

std::optional<std::vector<rxseal::schema::ledger_event_record_t>> fetch_events(
    client& ledger,
    uint64_t from_id,
    uint64_t to_id,
    std::chrono::milliseconds timeout,
    std::string& error);

/// Look up the signer's next nonce, sign `payload` with `key` and submit it.
/// The nonce lookup and the submit each get the full `timeout`.
rxseal::schema::ledger_receipt_t sign_and_submit(
    client& ledger,
    const rxseal::crypto::signing_key& key,
    rxseal::schema::ledger_payload_t payload,
    std::chrono::milliseconds timeout);

}  // namespace rxseal::ledger
