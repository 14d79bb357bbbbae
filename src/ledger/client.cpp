#include <rxseal/ledger/client.hpp>
#include <rxseal/ledger/signing.hpp>
#include <rxseal/schema/encoding/scale/encoder.hpp>
#include <rxseal/schema/ledger_error_code.hpp>

#include <spdlog/spdlog.h>

#include <tuple>

using namespace rxseal::schema;

namespace rxseal::ledger {

namespace {

template <typename T, typename Args>
std::optional<T> query_value(client& ledger,
                             const std::string_view path,
                             const Args& args,
                             const std::chrono::milliseconds timeout,
                             std::string& error) {
  auto encoder = encoding::scale_encoder_t{};
  auto data = encoder.encode(args);
  auto result = ledger.query(path, bytes_view_t{data}, timeout, error);
  if (!result) {
    return std::nullopt;
  }
  if (result->code != 0) {
    error = "query " + std::string{path} + " failed: " + result->log;
    return std::nullopt;
  }
  auto value = encoder.try_decode<T>(bytes_view_t{result->value});
  if (!value) {
    error = "query " + std::string{path} + " returned undecodable value";
    return std::nullopt;
  }
  return value;
}

}  // namespace

ledger_receipt_t make_transport_failure(std::string message) {
  return ledger_receipt_t{
      .code = static_cast<uint32_t>(ledger_error_code::transport_failure),
      .log = std::move(message),
      .codespace = std::string{kTransportCodespace}};
}

std::optional<prescription_record_t> fetch_prescription(
    client& ledger,
    const prescription_id_t& id,
    const std::chrono::milliseconds timeout,
    std::string& error) {
  return query_value<prescription_record_t>(ledger, "/prescription", id,
                                            timeout, error);
}

std::optional<uint64_t> fetch_next_nonce(client& ledger,
                                         const account_id_t& account,
                                         const std::chrono::milliseconds timeout,
                                         std::string& error) {
  return query_value<uint64_t>(ledger, "/nonce", account, timeout, error);
}

std::optional<bool> fetch_role(client& ledger,
                               const role_id_t role,
                               const account_id_t& account,
                               const std::chrono::milliseconds timeout,
                               std::string& error) {
  return query_value<bool>(ledger, "/role", std::tuple{role, account}, timeout,
                           error);
}

std::optional<std::pair<bool, bool>> fetch_hash_verification(
    client& ledger,
    const prescription_id_t& id,
    const hash32_t& patient_hash,
    const hash32_t& medication_hash,
    const std::chrono::milliseconds timeout,
    std::string& error) {
  auto matches = query_value<std::tuple<bool, bool>>(
      ledger, "/prescription/verify_hash",
      std::tuple{id, patient_hash, medication_hash}, timeout, error);
  if (!matches) {
    return std::nullopt;
  }
  return std::pair{std::get<0>(*matches), std::get<1>(*matches)};
}

std::optional<std::vector<ledger_event_record_t>> fetch_events(
    client& ledger,
    const uint64_t from_id,
    const uint64_t to_id,
    const std::chrono::milliseconds timeout,
    std::string& error) {
  return query_value<std::vector<ledger_event_record_t>>(
      ledger, "/events/range", std::tuple{from_id, to_id}, timeout, error);
}

ledger_receipt_t sign_and_submit(client& ledger,
                                 const rxseal::crypto::signing_key& key,
                                 ledger_payload_t payload,
                                 const std::chrono::milliseconds timeout) {
  auto error = std::string{};
  auto account = rxseal::crypto::make_account_id(key.public_key());
  auto nonce = fetch_next_nonce(ledger, account, timeout, error);
  if (!nonce) {
    spdlog::error("Failed to read nonce for {}: {}", to_prefixed_hex(account),
                  error);
    return make_transport_failure(error);
  }
  auto call = make_signed_call(key, *nonce, std::move(payload));
  if (!call) {
    return make_transport_failure("failed to sign ledger call");
  }
  return ledger.submit(*call, timeout);
}

}  // namespace rxseal::ledger
