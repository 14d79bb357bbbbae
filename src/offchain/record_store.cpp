#include <rxseal/offchain/record_store.hpp>
#include <rxseal/schema/prescription_id.hpp>

#include <boost/endian/buffers.hpp>
#include <spdlog/spdlog.h>

#include <iterator>

using namespace rxseal::schema;

namespace rxseal::offchain {

namespace {

bool same_canonical_fields(const offchain_record_t& lhs,
                           const offchain_record_t& rhs) {
  if (lhs.short_code != rhs.short_code || lhs.doctor != rhs.doctor ||
      lhs.patient_name != rhs.patient_name ||
      lhs.patient_age != rhs.patient_age || lhs.status != rhs.status ||
      lhs.medicines.size() != rhs.medicines.size()) {
    return false;
  }
  for (auto i = std::size_t{0}; i < lhs.medicines.size(); ++i) {
    const auto& a = lhs.medicines[i];
    const auto& b = rhs.medicines[i];
    if (a.name != b.name || a.dosage != b.dosage || a.quantity != b.quantity) {
      return false;
    }
  }
  return true;
}

}  // namespace

bytes_t make_record_key(const std::string_view short_code) {
  auto key = make_bytes(kRecordPrefix);
  key.insert(std::end(key), std::begin(short_code), std::end(short_code));
  return key;
}

bytes_t make_security_event_key(const uint64_t event_id) {
  auto key = make_bytes(kSecurityEventPrefix);
  auto ordered = boost::endian::big_uint64_buf_t{event_id};
  auto raw = reinterpret_cast<const uint8_t*>(ordered.data());
  key.insert(std::end(key), raw, raw + sizeof(ordered));
  return key;
}

record_store::record_store(encoding::scale_encoder_t& encoder,
                           storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<offchain_record_t> record_store::load(
    const std::string_view short_code) const {
  return storage_.get<offchain_record_t>(encoder_,
                                         make_record_key(short_code));
}

void record_store::store(const offchain_record_t& record) const {
  storage_.put(encoder_, make_record_key(record.short_code), record);
}

bool record_store::insert(const offchain_record_t& record, std::string& error) {
  if (!is_valid_short_code(record.short_code)) {
    error = "invalid short code '" + record.short_code + "'";
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  if (load(record.short_code)) {
    error = "record " + record.short_code + " already exists";
    return false;
  }
  store(record);
  spdlog::debug("Stored off-chain record {}", record.short_code);
  return true;
}

std::optional<offchain_record_t> record_store::find(
    const std::string_view short_code) const {
  auto lock = std::scoped_lock{mutex_};
  return load(short_code);
}

std::vector<offchain_record_t> record_store::list() const {
  auto lock = std::scoped_lock{mutex_};
  auto records = std::vector<offchain_record_t>{};
  auto prefix = make_bytes(kRecordPrefix);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    records.push_back(encoder_.decode<offchain_record_t>(value));
  }
  return records;
}

std::optional<offchain_record_t> record_store::transition(
    const std::string_view short_code,
    const offchain_status_t to,
    const record_mutation_t& mutate,
    std::string& error) {
  auto lock = std::scoped_lock{mutex_};
  auto record = load(short_code);
  if (!record) {
    error = "record " + std::string{short_code} + " not found";
    return std::nullopt;
  }
  if (!is_valid_transition(record->status, to)) {
    error = "invalid transition " + std::string{to_string(record->status)} +
            " -> " + std::string{to_string(to)};
    spdlog::warn("Blocked status change for {}: {}", short_code, error);
    return std::nullopt;
  }
  auto from = record->status;
  if (mutate) {
    mutate(*record);
  }
  record->status = to;
  store(*record);
  spdlog::info("Off-chain record {} moved {} -> {}", short_code,
               to_string(from), to_string(to));
  return record;
}

std::optional<offchain_record_t> record_store::update(
    const std::string_view short_code,
    const record_mutation_t& mutate,
    std::string& error) {
  auto lock = std::scoped_lock{mutex_};
  auto record = load(short_code);
  if (!record) {
    error = "record " + std::string{short_code} + " not found";
    return std::nullopt;
  }
  auto updated = *record;
  if (mutate) {
    mutate(updated);
  }
  if (!same_canonical_fields(*record, updated)) {
    error = "update may not change canonical fields or status";
    return std::nullopt;
  }
  store(updated);
  return updated;
}

uint64_t record_store::record_security_event(security_event_record_t event) {
  auto lock = std::scoped_lock{mutex_};
  auto sequence_key = make_bytes(kSecurityEventSequenceKey);
  auto sequence =
      storage_.get<uint64_t>(encoder_, sequence_key).value_or(0) + 1;
  event.event_id = sequence;
  storage_.write_batch({
      {make_security_event_key(sequence), encoder_.encode(event)},
      {sequence_key, encoder_.encode(sequence)},
  });
  spdlog::warn("Security event {} [{}] {} {}: {}", sequence,
               to_string(event.severity), to_string(event.type),
               event.short_code, event.message);
  return sequence;
}

std::vector<security_event_record_t> record_store::security_events() const {
  auto lock = std::scoped_lock{mutex_};
  auto events = std::vector<security_event_record_t>{};
  auto prefix = make_bytes(kSecurityEventPrefix);
  for (const auto& [key, value] : storage_.list_by_prefix(prefix)) {
    events.push_back(encoder_.decode<security_event_record_t>(value));
  }
  return events;
}

}  // namespace rxseal::offchain
