#include <rxseal/canonical/snapshot.hpp>
#include <rxseal/schema/ledger_error_code.hpp>
#include <rxseal/schema/prescription_id.hpp>
#include <rxseal/service/prescription_service.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <utility>

using namespace rxseal::schema;

namespace rxseal::service {

namespace {

service_error make_error(const service_error_code code,
                         const uint16_t http_status,
                         std::string message) {
  return service_error{
      .code = code, .http_status = http_status, .message = std::move(message)};
}

bool is_transport_failure(const ledger_receipt_t& receipt) {
  return receipt.codespace == rxseal::ledger::kTransportCodespace;
}

uint16_t refusal_status(const ledger_receipt_t& receipt) {
  if (is_transport_failure(receipt)) {
    return 503;
  }
  switch (static_cast<ledger_error_code>(receipt.code)) {
    case ledger_error_code::invalid_signature:
    case ledger_error_code::invalid_nonce:
    case ledger_error_code::not_owner:
    case ledger_error_code::not_doctor:
    case ledger_error_code::not_pharmacy:
    case ledger_error_code::not_issuer:
    case ledger_error_code::prescription_not_active:
    case ledger_error_code::prescription_expired:
      return 403;
    default:
      return 409;
  }
}

std::optional<std::string_view> find_attribute(const ledger_receipt_t& receipt,
                                               const std::string_view type,
                                               const std::string_view key) {
  for (const auto& event : receipt.events) {
    if (event.type != type) {
      continue;
    }
    for (const auto& attribute : event.attributes) {
      if (attribute.key == key) {
        return std::string_view{attribute.value};
      }
    }
  }
  return std::nullopt;
}

}  // namespace

std::string_view to_string(const service_error_code code) {
  switch (code) {
    case service_error_code::malformed_input:
      return "malformed_input";
    case service_error_code::not_found:
      return "not_found";
    case service_error_code::invalid_state:
      return "invalid_state";
    case service_error_code::validation_rejected:
      return "validation_rejected";
    case service_error_code::ledger_unreachable:
      return "ledger_unreachable";
    case service_error_code::ledger_refused:
      return "ledger_refused";
    case service_error_code::store_failure:
      return "store_failure";
  }
  return "unknown";
}

std::string_view to_string(const reconciliation_state state) {
  switch (state) {
    case reconciliation_state::matched:
      return "matched";
    case reconciliation_state::mismatched:
      return "mismatched";
    case reconciliation_state::not_on_ledger:
      return "not_on_ledger";
    case reconciliation_state::unreachable:
      return "unreachable";
  }
  return "unknown";
}

prescription_service::prescription_service(
    rxseal::ledger::client& ledger,
    rxseal::offchain::record_store& records,
    rxseal::validation::gate_options options,
    rxseal::common::unix_clock_t clock)
    : ledger_{ledger},
      records_{records},
      gate_{ledger, options, clock},
      options_{std::move(options)},
      clock_{std::move(clock)} {}

void prescription_service::record_security_event(
    const security_event_type_t type,
    const security_event_severity_t severity,
    std::string code,
    std::string short_code,
    std::string message,
    rxseal::validation::context_t context) {
  records_.record_security_event(security_event_record_t{
      .type = type,
      .severity = severity,
      .code = std::move(code),
      .short_code = std::move(short_code),
      .message = std::move(message),
      .context = std::move(context),
      .recorded_at = clock_()});
}

service_error prescription_service::reject_validation(
    const offchain_record_t& record,
    rxseal::validation::chain_validation_error error) {
  using rxseal::validation::http_status;
  auto type = security_event_type_t::validation_rejected;
  auto severity = security_event_severity_t::warning;
  auto ignored = std::string{};
  switch (error.code) {
    case chain_error_code::chain_unreachable:
      type = security_event_type_t::ledger_unreachable;
      severity = security_event_severity_t::error;
      break;
    case chain_error_code::hash_mismatch:
      type = security_event_type_t::hash_mismatch;
      severity = security_event_severity_t::critical;
      if (!records_.update(
              record.short_code,
              [](offchain_record_t& value) { value.hash_verified = false; },
              ignored)) {
        spdlog::error("Failed to flag {} as unverified: {}", record.short_code,
                      ignored);
      }
      break;
    case chain_error_code::expired_on_chain:
      if (record.status == offchain_status_t::active ||
          record.status == offchain_status_t::dispensed) {
        if (!records_.transition(record.short_code, offchain_status_t::expired,
                                 nullptr, ignored)) {
          spdlog::error("Failed to expire {}: {}", record.short_code, ignored);
        }
      }
      break;
    default:
      break;
  }
  record_security_event(type, severity, std::string{to_string(error.code)},
                        record.short_code, error.message, error.context);

  auto status = http_status(error.code);
  auto message = rxseal::validation::user_reason(error);
  auto result = make_error(service_error_code::validation_rejected, status,
                           std::move(message));
  result.chain_error = std::move(error);
  return result;
}

service_error prescription_service::reject_receipt(
    const std::string_view short_code,
    const std::string_view operation,
    ledger_receipt_t receipt) {
  auto transport = is_transport_failure(receipt);
  record_security_event(
      transport ? security_event_type_t::ledger_unreachable
                : security_event_type_t::ledger_refused,
      transport ? security_event_severity_t::error
                : security_event_severity_t::warning,
      receipt.codespace + ":" + std::to_string(receipt.code),
      std::string{short_code}, receipt.log,
      {{"operation", std::string{operation}}, {"info", receipt.info}});
  auto result = make_error(transport ? service_error_code::ledger_unreachable
                                     : service_error_code::ledger_refused,
                           refusal_status(receipt), receipt.log);
  result.receipt = std::move(receipt);
  return result;
}

result_t<mutation_result> prescription_service::issue(
    const issue_request& request,
    const rxseal::crypto::signing_key& doctor) {
  if (request.medicines.empty()) {
    return make_error(service_error_code::malformed_input, 400,
                      "at least one medicine is required");
  }
  if (request.max_usage == 0) {
    return make_error(service_error_code::malformed_input, 400,
                      "max usage must be at least 1");
  }
  auto error = std::string{};
  auto snapshot = rxseal::canonical::build_snapshot(
      request.patient_name, request.patient_age, request.medicines, error);
  if (!snapshot) {
    return make_error(service_error_code::malformed_input, 400, error);
  }

  auto now = clock_();
  auto short_code = request.short_code;
  if (short_code.empty()) {
    short_code = make_short_code(rxseal::canonical::trim(request.patient_name),
                                 rxseal::canonical::trim(request.patient_age),
                                 now * 1000);
  }
  auto id = try_encode_prescription_id(short_code);
  if (!id) {
    return make_error(service_error_code::malformed_input, 400,
                      "invalid short code '" + short_code + "'");
  }
  if (records_.find(short_code)) {
    return make_error(service_error_code::invalid_state, 409,
                      "prescription " + short_code + " already exists");
  }

  auto receipt = rxseal::ledger::sign_and_submit(
      ledger_, doctor,
      issue_prescription_t{
          .id = *id,
          .patient_hash = snapshot->patient_hash,
          .medication_hash = snapshot->medication_hash,
          .quantity = rxseal::canonical::total_quantity(*snapshot),
          .expiry_date = request.expiry_date,
          .max_usage = request.max_usage},
      options_.timeout);
  if (receipt.code != 0) {
    return reject_receipt(short_code, "issue", std::move(receipt));
  }

  auto record = offchain_record_t{
      .short_code = short_code,
      .doctor = rxseal::crypto::make_account_id(doctor.public_key()),
      .patient_name = request.patient_name,
      .patient_age = request.patient_age,
      .medicines = request.medicines,
      .notes = request.notes,
      .status = offchain_status_t::active,
      .usage_count = 0,
      .max_usage = request.max_usage,
      .expiry_date = request.expiry_date,
      .issued_at = now,
      .ledger_synced = true};
  if (!records_.insert(record, error)) {
    spdlog::error(
        "Prescription {} is on the ledger but not stored off-chain: {}",
        short_code, error);
    return make_error(service_error_code::store_failure, 500, error);
  }
  spdlog::info("Issued prescription {} at ledger height {}", short_code,
               receipt.height);
  return mutation_result{.record = std::move(record),
                         .receipt = std::move(receipt)};
}

result_t<rxseal::validation::validation_success> prescription_service::verify(
    const std::string_view short_code) {
  auto record = records_.find(short_code);
  if (!record) {
    return make_error(service_error_code::not_found, 404,
                      "prescription " + std::string{short_code} + " not found");
  }
  auto error = std::string{};
  auto snapshot = rxseal::canonical::build_snapshot(*record, error);
  if (!snapshot) {
    record_security_event(security_event_type_t::snapshot_malformed,
                          security_event_severity_t::error,
                          "SNAPSHOT_MALFORMED", record->short_code, error, {});
    return make_error(service_error_code::malformed_input, 422, error);
  }
  auto id = try_encode_prescription_id(record->short_code);
  if (!id) {
    return make_error(service_error_code::malformed_input, 422,
                      "stored short code is not a valid prescription id");
  }
  auto outcome = gate_.validate(*id, *snapshot);
  if (auto failure =
          std::get_if<rxseal::validation::chain_validation_error>(&outcome)) {
    return reject_validation(*record, std::move(*failure));
  }
  return std::get<rxseal::validation::validation_success>(std::move(outcome));
}

result_t<mutation_result> prescription_service::dispense(
    const std::string_view short_code,
    const rxseal::crypto::signing_key& pharmacy) {
  auto verified = verify(short_code);
  if (auto failure = std::get_if<service_error>(&verified)) {
    return std::move(*failure);
  }
  auto validated =
      std::get<rxseal::validation::validation_success>(std::move(verified));

  auto error = std::string{};
  auto current = records_.find(short_code);
  auto prior = current ? current->status : offchain_status_t::active;
  auto reserved = records_.transition(
      short_code, offchain_status_t::pending_dispense,
      [](offchain_record_t& value) { value.hash_verified = true; }, error);
  if (!reserved) {
    return make_error(service_error_code::invalid_state, 409, error);
  }

  auto receipt = rxseal::ledger::sign_and_submit(
      ledger_, pharmacy, dispense_prescription_t{.id = validated.record.id},
      options_.timeout);
  if (receipt.code != 0) {
    auto rollback = std::string{};
    if (!records_.transition(short_code, prior, nullptr, rollback)) {
      spdlog::error("Failed to roll back {}: {}", short_code, rollback);
    } else if (receipt.code == static_cast<uint32_t>(
                                   ledger_error_code::prescription_expired) &&
               !is_transport_failure(receipt) &&
               !records_.transition(short_code, offchain_status_t::expired,
                                    nullptr, rollback)) {
      spdlog::error("Failed to expire {}: {}", short_code, rollback);
    }
    return reject_receipt(short_code, "dispense", std::move(receipt));
  }

  auto usage_count = validated.record.usage_count + 1;
  if (auto remaining = find_attribute(receipt, "prescription_dispensed",
                                      "remaining_usage")) {
    auto value = uint32_t{};
    auto [end, ec] = std::from_chars(remaining->data(),
                                     remaining->data() + remaining->size(),
                                     value);
    if (ec == std::errc{} && end == remaining->data() + remaining->size() &&
        value <= validated.record.max_usage) {
      usage_count = validated.record.max_usage - value;
    }
  }
  auto exhausted = usage_count >= validated.record.max_usage;
  if (auto status =
          find_attribute(receipt, "prescription_dispensed", "status")) {
    exhausted = *status == to_string(prescription_status_t::used);
  }

  auto now = clock_();
  auto dispensed = records_.transition(
      short_code,
      exhausted ? offchain_status_t::used : offchain_status_t::dispensed,
      [&](offchain_record_t& value) {
        value.usage_count = usage_count;
        value.dispensed_at = now;
        value.ledger_synced = true;
      },
      error);
  if (!dispensed) {
    spdlog::error("Dispense of {} committed on the ledger but not recorded: {}",
                  short_code, error);
    return make_error(service_error_code::store_failure, 500, error);
  }
  spdlog::info("Dispensed prescription {} ({}/{} uses) at ledger height {}",
               short_code, usage_count, validated.record.max_usage,
               receipt.height);
  return mutation_result{.record = std::move(*dispensed),
                         .receipt = std::move(receipt)};
}

result_t<offchain_record_t> prescription_service::resolve_pending(
    const std::string_view short_code) {
  auto record = records_.find(short_code);
  if (!record) {
    return make_error(service_error_code::not_found, 404,
                      "prescription " + std::string{short_code} + " not found");
  }
  if (record->status != offchain_status_t::pending_dispense) {
    return make_error(service_error_code::invalid_state, 409,
                      fmt::format("prescription {} is {}, not PENDING_DISPENSE",
                                  short_code, to_string(record->status)));
  }
  auto id = try_encode_prescription_id(record->short_code);
  if (!id) {
    return make_error(service_error_code::malformed_input, 422,
                      "stored short code is not a valid prescription id");
  }
  auto error = std::string{};
  auto on_ledger =
      rxseal::ledger::fetch_prescription(ledger_, *id, options_.timeout, error);
  if (!on_ledger) {
    return make_error(service_error_code::ledger_unreachable, 503, error);
  }
  if (!exists(*on_ledger)) {
    return make_error(service_error_code::invalid_state, 409,
                      fmt::format("prescription {} is not on the ledger",
                                  short_code));
  }

  auto resolved = std::optional<offchain_record_t>{};
  if (on_ledger->usage_count > record->usage_count) {
    auto now = clock_();
    auto used = on_ledger->status == prescription_status_t::used ||
                on_ledger->usage_count >= on_ledger->max_usage;
    resolved = records_.transition(
        short_code, used ? offchain_status_t::used : offchain_status_t::dispensed,
        [&](offchain_record_t& value) {
          value.usage_count = on_ledger->usage_count;
          value.dispensed_at = now;
          value.ledger_synced = true;
        },
        error);
  } else {
    auto prior = record->usage_count > 0 ? offchain_status_t::dispensed
                                         : offchain_status_t::active;
    resolved = records_.transition(short_code, prior, nullptr, error);
    if (resolved && on_ledger->status == prescription_status_t::expired) {
      resolved = records_.transition(short_code, offchain_status_t::expired,
                                     nullptr, error);
    }
  }
  if (!resolved) {
    return make_error(service_error_code::store_failure, 500, error);
  }
  spdlog::warn("Resolved pending dispense of {} as {} (ledger usage {}/{})",
               short_code, to_string(resolved->status), on_ledger->usage_count,
               on_ledger->max_usage);
  return std::move(*resolved);
}

reconciliation_report prescription_service::reconcile() {
  auto report = reconciliation_report{};
  auto records = records_.list();
  auto error = std::string{};
  auto reachable = ledger_.ping(options_.timeout, error);
  if (!reachable) {
    record_security_event(security_event_type_t::ledger_unreachable,
                          security_event_severity_t::error,
                          std::string{to_string(
                              chain_error_code::chain_unreachable)},
                          "", "Reconciliation skipped; ledger unreachable",
                          {{"rpcUrl", options_.endpoint}, {"rawError", error}});
  }

  for (const auto& record : records) {
    auto entry = reconciliation_entry{.short_code = record.short_code};
    auto on_ledger = std::optional<prescription_record_t>{};
    auto snapshot = std::optional<rxseal::canonical::snapshot>{};
    auto id = try_encode_prescription_id(record.short_code);
    if (!reachable) {
      entry.state = reconciliation_state::unreachable;
      entry.detail = error;
    } else if (!id) {
      entry.state = reconciliation_state::mismatched;
      entry.detail = "stored short code is not a valid prescription id";
    } else if (!(on_ledger = rxseal::ledger::fetch_prescription(
                     ledger_, *id, options_.timeout, error))) {
      entry.state = reconciliation_state::unreachable;
      entry.detail = error;
    } else if (!exists(*on_ledger)) {
      entry.state = reconciliation_state::not_on_ledger;
    } else if (!(snapshot = rxseal::canonical::build_snapshot(record, error))) {
      entry.state = reconciliation_state::mismatched;
      entry.detail = error;
    } else {
      entry.integrity = rxseal::validation::hash_integrity{
          .patient_match = on_ledger->patient_hash == snapshot->patient_hash,
          .medication_match =
              on_ledger->medication_hash == snapshot->medication_hash};
      entry.state = entry.integrity.patient_match &&
                            entry.integrity.medication_match
                        ? reconciliation_state::matched
                        : reconciliation_state::mismatched;
    }

    switch (entry.state) {
      case reconciliation_state::matched:
        ++report.matched;
        break;
      case reconciliation_state::mismatched:
        ++report.mismatched;
        break;
      case reconciliation_state::not_on_ledger:
        ++report.not_on_ledger;
        break;
      case reconciliation_state::unreachable:
        ++report.unreachable;
        break;
    }

    if (entry.state == reconciliation_state::matched ||
        entry.state == reconciliation_state::mismatched) {
      auto verified = entry.state == reconciliation_state::matched;
      auto ignored = std::string{};
      if (!records_.update(
              record.short_code,
              [verified](offchain_record_t& value) {
                value.hash_verified = verified;
              },
              ignored)) {
        spdlog::error("Failed to store verification for {}: {}",
                      record.short_code, ignored);
      }
    }
    if (entry.state == reconciliation_state::mismatched ||
        entry.state == reconciliation_state::not_on_ledger) {
      record_security_event(
          security_event_type_t::reconciliation_mismatch,
          security_event_severity_t::critical,
          std::string{to_string(entry.state)}, record.short_code,
          entry.detail.empty() ? "Off-chain record disagrees with the ledger"
                               : entry.detail,
          {{"patientMatch", entry.integrity.patient_match ? "true" : "false"},
           {"medMatch", entry.integrity.medication_match ? "true" : "false"}});
    }
    report.entries.push_back(std::move(entry));
  }

  spdlog::info(
      "Reconciliation: {} matched, {} mismatched, {} not on ledger, {} "
      "unreachable",
      report.matched, report.mismatched, report.not_on_ledger,
      report.unreachable);
  return report;
}

std::size_t prescription_service::sweep_expired(
    const timestamp_seconds_t now) {
  auto moved = std::size_t{0};
  for (const auto& record : records_.list()) {
    if (record.status != offchain_status_t::active &&
        record.status != offchain_status_t::dispensed) {
      continue;
    }
    if (record.expiry_date > now) {
      continue;
    }
    auto error = std::string{};
    if (records_.transition(record.short_code, offchain_status_t::expired,
                            nullptr, error)) {
      ++moved;
    } else {
      spdlog::warn("Expiry sweep skipped {}: {}", record.short_code, error);
    }
  }
  if (moved > 0) {
    spdlog::info("Expiry sweep moved {} record(s) to EXPIRED", moved);
  }
  return moved;
}

}  // namespace rxseal::service
