#include <rxseal/blake3/hash.hpp>
#include <rxseal/canonical/snapshot.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <charconv>
#include <cmath>

#include <fmt/format.h>

namespace rxseal::canonical {

namespace {

bool is_ascii_space(const char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' ||
         c == '\r';
}

}  // namespace

std::string trim(const std::string_view value) {
  auto begin = std::size_t{0};
  auto end = value.size();
  while (begin < end && is_ascii_space(value[begin])) {
    ++begin;
  }
  while (end > begin && is_ascii_space(value[end - 1])) {
    --end;
  }
  return std::string{value.substr(begin, end - begin)};
}

std::optional<uint64_t> coerce_quantity(const std::string_view raw,
                                        std::string& error) {
  auto text = trim(raw);
  if (text.empty()) {
    return uint64_t{0};
  }

  // Spelled-out nan and inf are words, not numbers.
  if (std::ranges::none_of(text, [](const char c) {
        return c >= '0' && c <= '9';
      })) {
    return uint64_t{0};
  }

  auto digits = std::string_view{text};
  if (digits.front() == '+') {
    digits.remove_prefix(1);
  }
  auto parsed = double{};
  auto [end, ec] =
      std::from_chars(digits.data(), digits.data() + digits.size(), parsed);
  if (ec == std::errc::result_out_of_range) {
    error = fmt::format("quantity '{}' is out of range", text);
    return std::nullopt;
  }
  if (ec != std::errc{} || end != digits.data() + digits.size()) {
    // Non-numeric text is committed as zero.
    return uint64_t{0};
  }
  if (std::isnan(parsed)) {
    return uint64_t{0};
  }
  if (parsed < 0.0) {
    error = fmt::format("quantity '{}' is negative", text);
    return std::nullopt;
  }
  auto floored = std::floor(parsed);
  if (floored > static_cast<double>(kMaxCanonicalQuantity)) {
    error = fmt::format("quantity '{}' exceeds {}", text,
                        kMaxCanonicalQuantity);
    return std::nullopt;
  }
  return static_cast<uint64_t>(floored);
}

std::optional<std::vector<canonical_medicine>> canonicalize_medicines(
    const std::vector<rxseal::schema::medicine_entry_t>& medicines,
    std::string& error) {
  auto canonical = std::vector<canonical_medicine>{};
  canonical.reserve(medicines.size());
  for (std::size_t i = 0; i < medicines.size(); ++i) {
    const auto& medicine = medicines[i];
    auto name = trim(medicine.name);
    if (name.empty()) {
      error = fmt::format("medicine {} has an empty name", i);
      return std::nullopt;
    }
    auto quantity_error = std::string{};
    auto quantity = coerce_quantity(medicine.quantity, quantity_error);
    if (!quantity) {
      error = fmt::format("medicine '{}': {}", name, quantity_error);
      return std::nullopt;
    }
    canonical.push_back(canonical_medicine{.name = std::move(name),
                                           .dosage = trim(medicine.dosage),
                                           .quantity = *quantity});
  }
  std::ranges::stable_sort(canonical, {}, &canonical_medicine::name);
  return canonical;
}

std::optional<std::string> serialize_medicines(
    const std::vector<canonical_medicine>& medicines,
    std::string& error) {
  auto array = nlohmann::ordered_json::array();
  for (const auto& medicine : medicines) {
    auto entry = nlohmann::ordered_json::object();
    entry["name"] = medicine.name;
    entry["dosage"] = medicine.dosage;
    entry["quantity"] = medicine.quantity;
    array.push_back(std::move(entry));
  }
  try {
    return array.dump();
  } catch (const nlohmann::ordered_json::type_error& e) {
    error = fmt::format("medicine list is not valid UTF-8: {}", e.what());
    return std::nullopt;
  }
}

std::optional<rxseal::schema::hash32_t> patient_identity_hash(
    const std::string_view patient_name,
    const std::string_view patient_age,
    std::string& error) {
  auto name = trim(patient_name);
  auto age = trim(patient_age);
  if (name.empty()) {
    error = "patient name is empty";
    return std::nullopt;
  }
  if (age.empty()) {
    error = "patient age is empty";
    return std::nullopt;
  }
  return rxseal::blake3::hash(name + age);
}

std::optional<rxseal::schema::hash32_t> medication_hash(
    const std::vector<rxseal::schema::medicine_entry_t>& medicines,
    std::string& error) {
  auto canonical = canonicalize_medicines(medicines, error);
  if (!canonical) {
    return std::nullopt;
  }
  auto serialized = serialize_medicines(*canonical, error);
  if (!serialized) {
    return std::nullopt;
  }
  return rxseal::blake3::hash(*serialized);
}

std::optional<snapshot> build_snapshot(
    const std::string_view patient_name,
    const std::string_view patient_age,
    const std::vector<rxseal::schema::medicine_entry_t>& medicines,
    std::string& error) {
  auto patient_hash = patient_identity_hash(patient_name, patient_age, error);
  if (!patient_hash) {
    return std::nullopt;
  }
  auto canonical = canonicalize_medicines(medicines, error);
  if (!canonical) {
    return std::nullopt;
  }
  auto serialized = serialize_medicines(*canonical, error);
  if (!serialized) {
    return std::nullopt;
  }
  auto medication = rxseal::blake3::hash(*serialized);
  return snapshot{.medicines = std::move(*canonical),
                  .serialized = std::move(*serialized),
                  .patient_hash = *patient_hash,
                  .medication_hash = medication};
}

std::optional<snapshot> build_snapshot(
    const rxseal::schema::offchain_record_t& record,
    std::string& error) {
  return build_snapshot(record.patient_name, record.patient_age,
                        record.medicines, error);
}

uint64_t total_quantity(const snapshot& value) {
  auto total = uint64_t{0};
  for (const auto& medicine : value.medicines) {
    total += medicine.quantity;
  }
  return total;
}

}  // namespace rxseal::canonical
