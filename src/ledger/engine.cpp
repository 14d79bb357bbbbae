#include <rxseal/blake3/hash.hpp>
#include <rxseal/common/critical.hpp>
#include <rxseal/crypto/signing_key.hpp>
#include <rxseal/crypto/verify.hpp>
#include <rxseal/ledger/engine.hpp>
#include <rxseal/ledger/keys.hpp>
#include <rxseal/ledger/signing.hpp>
#include <rxseal/schema/prescription_id.hpp>
#include <rxseal/schema/query_error_code.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>
#include <tuple>
#include <variant>

using namespace rxseal::schema;

namespace rxseal::ledger {

struct engine::execution final {
  uint32_t code{};
  std::string log;
  std::string info;
  /// Writes must land even though `code` is non-zero.
  bool commits{};
  std::vector<rxseal::storage::key_value_entry_t> writes;
  std::vector<ledger_event_t> events;
};

namespace {

void reject(auto& result, const ledger_error_code code, std::string log) {
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
}

ledger_event_attribute_t attribute(std::string key,
                                   std::string value,
                                   const bool index = false) {
  return ledger_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

ledger_receipt_t make_rejection(const ledger_error_code code,
                                std::string log,
                                std::string info = {}) {
  auto receipt = ledger_receipt_t{};
  reject(receipt, code, std::move(log));
  receipt.info = std::move(info);
  receipt.codespace = std::string{kLedgerCodespace};
  return receipt;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const uint64_t height) {
  spdlog::debug("Query refused ({}): {}", to_string(code), log);
  return query_result_t{.code = static_cast<uint32_t>(code),
                        .log = std::move(log),
                        .height = height,
                        .codespace = std::string{kQueryCodespace}};
}

std::string_view payload_name(const ledger_payload_t& payload) {
  return std::visit(
      overloaded{[](const register_doctor_t&) -> std::string_view {
                   return "register_doctor";
                 },
                 [](const register_pharmacy_t&) -> std::string_view {
                   return "register_pharmacy";
                 },
                 [](const issue_prescription_t&) -> std::string_view {
                   return "issue_prescription";
                 },
                 [](const dispense_prescription_t&) -> std::string_view {
                   return "dispense_prescription";
                 },
                 [](const set_patient_commitment_t&) -> std::string_view {
                   return "set_patient_commitment";
                 }},
      payload);
}

}  // namespace

engine::engine(rxseal::schema::encoding::scale_encoder_t& encoder,
               rxseal::storage::rocksdb_storage_t& storage,
               const account_id_t& owner,
               rxseal::common::unix_clock_t clock,
               const bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      clock_{std::move(clock)},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{rxseal::crypto::verify_signature} {
  if (!clock_) {
    rxseal::common::critical("ledger engine requires a clock");
  }
  load_persisted_state(owner);
  if (!require_strict_crypto_) {
    spdlog::warn("Ledger signature verification is disabled");
  }
}

void engine::load_persisted_state(const account_id_t& owner) {
  auto owner_key = keys::make_key(keys::kOwnerKey);
  auto stored_owner = storage_.get<account_id_t>(encoder_, owner_key);
  if (stored_owner) {
    if (!is_zero_hash(owner) && owner != *stored_owner) {
      spdlog::warn("Configured owner {} ignored; ledger owner is {}",
                   to_prefixed_hex(owner), to_prefixed_hex(*stored_owner));
    }
    owner_ = *stored_owner;
  } else {
    if (is_zero_hash(owner)) {
      rxseal::common::critical(
          "ledger owner must be configured on first start");
    }
    storage_.put(encoder_, owner_key, owner);
    owner_ = owner;
    spdlog::info("Initialized ledger owner {}", to_prefixed_hex(owner_));
  }

  height_ = storage_.get<uint64_t>(encoder_, keys::make_key(keys::kHeightKey))
                .value_or(0);
  event_sequence_ =
      storage_
          .get<uint64_t>(encoder_, keys::make_key(keys::kEventSequenceKey))
          .value_or(0);
  spdlog::info("Ledger state loaded at height {} with {} events", height_,
               event_sequence_);
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

ledger_receipt_t engine::submit(const bytes_view_t& raw_call) {
  auto call = encoder_.try_decode<ledger_call_t>(raw_call);
  if (!call) {
    spdlog::warn("Rejected undecodable ledger call ({} bytes)",
                 raw_call.size());
    return make_rejection(ledger_error_code::invalid_call, "Malformed call");
  }
  return submit(*call);
}

ledger_receipt_t engine::submit(const ledger_call_t& call) {
  auto caller = rxseal::crypto::make_account_id(call.signer);

  auto lock = std::scoped_lock{mutex_};
  auto validation = validate_call(call, caller);
  if (validation.code != 0) {
    spdlog::warn("Rejected {} from {}: {}", payload_name(call.payload),
                 to_prefixed_hex(caller), validation.log);
    return validation;
  }

  auto result = execution{};
  std::visit([&](const auto& operation) { execute(operation, caller, result); },
             call.payload);

  if (result.code != 0 && !result.commits) {
    spdlog::warn("Refused {} from {}: {}", payload_name(call.payload),
                 to_prefixed_hex(caller), result.log);
    auto receipt = make_rejection(static_cast<ledger_error_code>(result.code),
                                  std::move(result.log), std::move(result.info));
    receipt.height = height_;
    return receipt;
  }
  return commit(call, caller, std::move(result));
}

ledger_receipt_t engine::validate_call(const ledger_call_t& call,
                                       const account_id_t& caller) const {
  if (call.version != 1) {
    return make_rejection(ledger_error_code::unsupported_call_version,
                          "Unsupported call version");
  }
  auto payload_version =
      std::visit([](const auto& operation) { return operation.version; },
                 call.payload);
  if (payload_version != 1) {
    return make_rejection(ledger_error_code::unsupported_call_version,
                          "Unsupported payload version");
  }

  auto expected_nonce = load_nonce(caller) + 1;
  if (call.nonce != expected_nonce) {
    return make_rejection(ledger_error_code::invalid_nonce, "Invalid nonce",
                          "expected nonce " + std::to_string(expected_nonce));
  }

  if (require_strict_crypto_) {
    auto message = signing_bytes(call);
    if (!signature_verifier_ ||
        !signature_verifier_(bytes_view_t{message}, call.signer,
                             call.signature)) {
      return make_rejection(ledger_error_code::invalid_signature,
                            "Signature verification failed");
    }
  }
  return ledger_receipt_t{};
}

ledger_receipt_t engine::commit(const ledger_call_t& call,
                                const account_id_t& caller,
                                execution&& result) {
  auto now = clock_();
  auto height = height_ + 1;
  auto sequence = event_sequence_;
  auto writes = std::move(result.writes);

  writes.emplace_back(keys::make_nonce_key(caller),
                      encoder_.encode(call.nonce));
  writes.emplace_back(keys::make_key(keys::kHeightKey),
                      encoder_.encode(height));
  for (const auto& event : result.events) {
    ++sequence;
    auto record = ledger_event_record_t{.event_id = sequence,
                                        .height = height,
                                        .recorded_at = now,
                                        .event = event};
    writes.emplace_back(keys::make_event_key(sequence),
                        encoder_.encode(record));
  }
  writes.emplace_back(keys::make_key(keys::kEventSequenceKey),
                      encoder_.encode(sequence));
  storage_.write_batch(writes);

  height_ = height;
  event_sequence_ = sequence;

  auto encoded_call = encoder_.encode(call);
  auto receipt = ledger_receipt_t{
      .code = result.code,
      .log = std::move(result.log),
      .info = std::move(result.info),
      .codespace = std::string{kLedgerCodespace},
      .height = height,
      .call_hash = rxseal::blake3::hash(bytes_view_t{encoded_call}),
      .events = std::move(result.events)};
  spdlog::info("Committed {} from {} at height {} (code {}, {} events)",
               payload_name(call.payload), to_prefixed_hex(caller), height,
               receipt.code, receipt.events.size());
  return receipt;
}

void engine::execute(const register_doctor_t& operation,
                     const account_id_t& caller,
                     execution& result) const {
  grant_role(role_id_t::doctor, operation.account, caller, result);
}

void engine::execute(const register_pharmacy_t& operation,
                     const account_id_t& caller,
                     execution& result) const {
  grant_role(role_id_t::pharmacy, operation.account, caller, result);
}

void engine::grant_role(const role_id_t role,
                        const account_id_t& account,
                        const account_id_t& caller,
                        execution& result) const {
  if (caller != owner_) {
    reject(result, ledger_error_code::not_owner, "Not the owner");
    return;
  }
  if (is_zero_hash(account)) {
    reject(result, ledger_error_code::invalid_call, "Invalid account");
    return;
  }
  if (load_role(role, account)) {
    result.info = "already registered";
    return;
  }
  result.writes.emplace_back(keys::make_role_key(role, account),
                             encoder_.encode(true));
  result.events.push_back(ledger_event_t{
      .type = "role_granted",
      .attributes = {attribute("role", std::string{to_string(role)}, true),
                     attribute("account", to_prefixed_hex(account), true)}});
}

void engine::execute(const issue_prescription_t& operation,
                     const account_id_t& caller,
                     execution& result) const {
  if (!load_role(role_id_t::doctor, caller)) {
    reject(result, ledger_error_code::not_doctor, "Not a doctor");
    return;
  }
  if (is_zero_hash(operation.id)) {
    reject(result, ledger_error_code::invalid_prescription_id,
           "Invalid prescription id");
    return;
  }
  if (exists(load_prescription(operation.id))) {
    reject(result, ledger_error_code::prescription_exists,
           "Prescription already exists");
    return;
  }
  if (is_zero_hash(operation.patient_hash) ||
      is_zero_hash(operation.medication_hash)) {
    reject(result, ledger_error_code::empty_commitment, "Empty commitment");
    return;
  }
  if (operation.max_usage == 0) {
    reject(result, ledger_error_code::invalid_usage_limit,
           "Max usage must be positive");
    return;
  }
  auto now = clock_();
  if (operation.expiry_date <= now) {
    reject(result, ledger_error_code::invalid_expiry,
           "Expiry must be in the future");
    return;
  }

  auto record = prescription_record_t{
      .id = operation.id,
      .issuer = caller,
      .status = prescription_status_t::active,
      .usage_count = 0,
      .max_usage = operation.max_usage,
      .quantity = operation.quantity,
      .expiry_date = operation.expiry_date,
      .issued_at = now,
      .patient_hash = operation.patient_hash,
      .medication_hash = operation.medication_hash};
  result.writes.emplace_back(keys::make_prescription_key(record.id),
                             encoder_.encode(record));
  result.events.push_back(ledger_event_t{
      .type = "prescription_created",
      .attributes = {
          attribute("prescription_id", describe_prescription_id(record.id),
                    true),
          attribute("issuer", to_prefixed_hex(record.issuer), true),
          attribute("medication_hash", to_prefixed_hex(record.medication_hash)),
          attribute("expiry_date", std::to_string(record.expiry_date)),
          attribute("max_usage", std::to_string(record.max_usage))}});
}

void engine::execute(const dispense_prescription_t& operation,
                     const account_id_t& caller,
                     execution& result) const {
  if (!load_role(role_id_t::pharmacy, caller)) {
    reject(result, ledger_error_code::not_pharmacy, "Not a pharmacy");
    return;
  }
  auto record = load_prescription(operation.id);
  if (record.status != prescription_status_t::active) {
    reject(result, ledger_error_code::prescription_not_active,
           "Prescription not active");
    result.info = exists(record) ? std::string{to_string(record.status)}
                                 : std::string{"unknown prescription"};
    return;
  }

  auto prescription_id = describe_prescription_id(record.id);
  auto now = clock_();
  if (record.expiry_date <= now) {
    record.status = prescription_status_t::expired;
    result.writes.emplace_back(keys::make_prescription_key(record.id),
                               encoder_.encode(record));
    result.events.push_back(ledger_event_t{
        .type = "prescription_expired",
        .attributes = {
            attribute("prescription_id", prescription_id, true),
            attribute("expiry_date", std::to_string(record.expiry_date))}});
    reject(result, ledger_error_code::prescription_expired,
           "Prescription expired");
    result.commits = true;
    return;
  }

  ++record.usage_count;
  if (record.usage_count >= record.max_usage) {
    record.status = prescription_status_t::used;
  }
  result.writes.emplace_back(keys::make_prescription_key(record.id),
                             encoder_.encode(record));
  result.events.push_back(ledger_event_t{
      .type = "prescription_dispensed",
      .attributes = {
          attribute("prescription_id", prescription_id, true),
          attribute("pharmacy", to_prefixed_hex(caller), true),
          attribute("remaining_usage",
                    std::to_string(record.max_usage - record.usage_count)),
          attribute("status", std::string{to_string(record.status)})}});
}

void engine::execute(const set_patient_commitment_t& operation,
                     const account_id_t& caller,
                     execution& result) const {
  auto record = load_prescription(operation.id);
  if (!exists(record)) {
    reject(result, ledger_error_code::invalid_prescription_id,
           "Prescription not found");
    return;
  }
  if (record.issuer != caller) {
    reject(result, ledger_error_code::not_issuer, "Not the issuer");
    return;
  }
  if (is_zero_hash(operation.commitment)) {
    reject(result, ledger_error_code::empty_commitment, "Empty commitment");
    return;
  }
  if (!is_zero_hash(record.patient_commitment)) {
    reject(result, ledger_error_code::commitment_already_set,
           "Commitment already set");
    return;
  }
  record.patient_commitment = operation.commitment;
  result.writes.emplace_back(keys::make_prescription_key(record.id),
                             encoder_.encode(record));
  result.events.push_back(ledger_event_t{
      .type = "patient_commitment_set",
      .attributes = {
          attribute("prescription_id", describe_prescription_id(record.id),
                    true),
          attribute("commitment", to_prefixed_hex(operation.commitment))}});
}

prescription_record_t engine::load_prescription(
    const prescription_id_t& id) const {
  return storage_
      .get<prescription_record_t>(encoder_, keys::make_prescription_key(id))
      .value_or(prescription_record_t{});
}

bool engine::load_role(const role_id_t role,
                       const account_id_t& account) const {
  if (role == role_id_t::owner) {
    return account == owner_;
  }
  return storage_.get<bool>(encoder_, keys::make_role_key(role, account))
      .value_or(false);
}

uint64_t engine::load_nonce(const account_id_t& account) const {
  return storage_.get<uint64_t>(encoder_, keys::make_nonce_key(account))
      .value_or(0);
}

prescription_record_t engine::get_prescription(
    const prescription_id_t& id) const {
  auto lock = std::scoped_lock{mutex_};
  return load_prescription(id);
}

bool engine::has_role(const role_id_t role, const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return load_role(role, account);
}

uint64_t engine::next_nonce(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return load_nonce(account) + 1;
}

std::pair<bool, bool> engine::verify_prescription_hash(
    const prescription_id_t& id,
    const hash32_t& patient_hash,
    const hash32_t& medication_hash) const {
  auto lock = std::scoped_lock{mutex_};
  auto record = load_prescription(id);
  if (!exists(record)) {
    return {false, false};
  }
  return {record.patient_hash == patient_hash,
          record.medication_hash == medication_hash};
}

bool engine::verify_patient_ownership(const prescription_id_t& id,
                                      const hash32_t& commitment) const {
  auto lock = std::scoped_lock{mutex_};
  auto record = load_prescription(id);
  return exists(record) && !is_zero_hash(record.patient_commitment) &&
         record.patient_commitment == commitment;
}

std::vector<ledger_event_record_t> engine::events(const uint64_t from_id,
                                                  const uint64_t to_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<ledger_event_record_t>{};
  auto first = std::max<uint64_t>(from_id, 1);
  auto last = std::min(to_id, event_sequence_);
  for (auto id = first; id <= last; ++id) {
    auto record = storage_.get<ledger_event_record_t>(
        encoder_, keys::make_event_key(id));
    if (record) {
      out.push_back(std::move(*record));
    }
  }
  return out;
}

account_id_t engine::owner() const {
  auto lock = std::scoped_lock{mutex_};
  return owner_;
}

uint64_t engine::height() const {
  auto lock = std::scoped_lock{mutex_};
  return height_;
}

// Routes:
//   /prescription                   id                  -> prescription_record
//   /prescription/verify_hash       (id, patient, med)  -> (bool, bool)
//   /prescription/verify_ownership  (id, commitment)    -> bool
//   /role                           (role, account)     -> bool
//   /nonce                          account             -> uint64 next nonce
//   /events/range                   (from, to)          -> [ledger_event_record]
//   /engine/info                    -                   -> (height, owner, events)
query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto height = this->height();
  auto ok = [&](bytes_t value) {
    return query_result_t{.key = make_bytes(data),
                          .value = std::move(value),
                          .height = height,
                          .codespace = std::string{kQueryCodespace}};
  };
  auto invalid = [&] {
    return make_query_error(query_error_code::invalid_key,
                            "Malformed query data", height);
  };

  if (path == "/prescription") {
    auto id = encoder_.try_decode<prescription_id_t>(data);
    if (!id) {
      return invalid();
    }
    return ok(encoder_.encode(get_prescription(*id)));
  }
  if (path == "/prescription/verify_hash") {
    auto args =
        encoder_.try_decode<std::tuple<prescription_id_t, hash32_t, hash32_t>>(
            data);
    if (!args) {
      return invalid();
    }
    auto [patient_match, medication_match] = verify_prescription_hash(
        std::get<0>(*args), std::get<1>(*args), std::get<2>(*args));
    return ok(encoder_.encode(std::tuple{patient_match, medication_match}));
  }
  if (path == "/prescription/verify_ownership") {
    auto args =
        encoder_.try_decode<std::tuple<prescription_id_t, hash32_t>>(data);
    if (!args) {
      return invalid();
    }
    return ok(encoder_.encode(
        verify_patient_ownership(std::get<0>(*args), std::get<1>(*args))));
  }
  if (path == "/role") {
    auto args = encoder_.try_decode<std::tuple<role_id_t, account_id_t>>(data);
    if (!args) {
      return invalid();
    }
    return ok(
        encoder_.encode(has_role(std::get<0>(*args), std::get<1>(*args))));
  }
  if (path == "/nonce") {
    auto account = encoder_.try_decode<account_id_t>(data);
    if (!account) {
      return invalid();
    }
    return ok(encoder_.encode(next_nonce(*account)));
  }
  if (path == "/events/range") {
    auto args = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!args) {
      return invalid();
    }
    return ok(encoder_.encode(events(std::get<0>(*args), std::get<1>(*args))));
  }
  if (path == "/engine/info") {
    auto lock = std::scoped_lock{mutex_};
    return ok(encoder_.encode(std::tuple{height_, owner_, event_sequence_}));
  }
  return make_query_error(query_error_code::unsupported_path,
                          "Unsupported query path", height);
}

}  // namespace rxseal::ledger
