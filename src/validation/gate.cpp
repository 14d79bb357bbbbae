#include <rxseal/schema/prescription_id.hpp>
#include <rxseal/validation/gate.hpp>

#include <spdlog/spdlog.h>

#include <utility>

using namespace rxseal::schema;

namespace rxseal::validation {

namespace {

std::string to_flag(const bool value) {
  return value ? "true" : "false";
}

}  // namespace

gate::gate(rxseal::ledger::client& ledger,
           gate_options options,
           rxseal::common::unix_clock_t clock)
    : ledger_{ledger}, options_{std::move(options)}, clock_{std::move(clock)} {}

chain_validation_error gate::reject(const chain_error_code code,
                                    std::string message,
                                    const prescription_id_t& id,
                                    context_t context) const {
  auto error = chain_validation_error{
      .code = code, .message = std::move(message), .context = {}};
  error.context.reserve(context.size() + 1);
  error.context.emplace_back("prescriptionId", describe_prescription_id(id));
  for (auto& entry : context) {
    error.context.push_back(std::move(entry));
  }
  spdlog::warn("[{}] {} {}", to_string(code), error.message,
               format_context(error.context));
  return error;
}

validation_outcome_t gate::validate(
    const prescription_id_t& id,
    const rxseal::canonical::snapshot& snapshot) const {
  auto raw_error = std::string{};
  if (!ledger_.ping(options_.timeout, raw_error)) {
    return reject(chain_error_code::chain_unreachable,
                  "Ledger is unreachable; mutation blocked", id,
                  {{"rpcUrl", options_.endpoint}, {"rawError", raw_error}});
  }

  auto record =
      rxseal::ledger::fetch_prescription(ledger_, id, options_.timeout,
                                         raw_error);
  if (!record) {
    return reject(chain_error_code::chain_unreachable,
                  "Ledger read failed; mutation blocked", id,
                  {{"rpcUrl", options_.endpoint}, {"rawError", raw_error}});
  }
  if (!exists(*record)) {
    return reject(chain_error_code::not_found_on_chain,
                  "Prescription does not exist on the ledger", id, {});
  }

  if (record->status != prescription_status_t::active) {
    return reject(chain_error_code::status_mismatch,
                  "Ledger status is not ACTIVE", id,
                  {{"expected", std::string{to_string(
                                    prescription_status_t::active)}},
                   {"actual", std::string{to_string(record->status)}}});
  }

  if (record->usage_count >= record->max_usage) {
    return reject(chain_error_code::usage_exhausted,
                  "Usage limit reached on the ledger", id,
                  {{"usageCount", std::to_string(record->usage_count)},
                   {"maxUsage", std::to_string(record->max_usage)}});
  }

  auto now = clock_();
  if (record->expiry_date <= now) {
    return reject(
        chain_error_code::expired_on_chain,
        "Prescription expired on the ledger", id,
        {{"expiryDate", std::to_string(record->expiry_date)},
         {"nowUnix", std::to_string(now)},
         {"expiryISO", rxseal::common::to_iso8601(record->expiry_date)},
         {"nowISO", rxseal::common::to_iso8601(now)}});
  }

  auto integrity = hash_integrity{
      .patient_match = record->patient_hash == snapshot.patient_hash,
      .medication_match = record->medication_hash == snapshot.medication_hash};
  if (!integrity.patient_match || !integrity.medication_match) {
    return reject(chain_error_code::hash_mismatch,
                  "Off-chain data does not match ledger commitments", id,
                  {{"patientMatch", to_flag(integrity.patient_match)},
                   {"medMatch", to_flag(integrity.medication_match)},
                   {"storedPatientHash", to_prefixed_hex(record->patient_hash)},
                   {"computedPatientHash",
                    to_prefixed_hex(snapshot.patient_hash)},
                   {"storedMedHash", to_prefixed_hex(record->medication_hash)},
                   {"computedMedHash",
                    to_prefixed_hex(snapshot.medication_hash)}});
  }

  spdlog::info("Validation passed for {} (usage {}/{})",
               describe_prescription_id(id), record->usage_count,
               record->max_usage);
  return validation_success{.record = std::move(*record),
                            .integrity = integrity};
}

}  // namespace rxseal::validation
