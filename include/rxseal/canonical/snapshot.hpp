#pragma once

#include <rxseal/schema/medicine_entry.hpp>
#include <rxseal/schema/offchain_record.hpp>
#include <rxseal/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/// Canonical snapshot protocol, version 1.
///
/// Binds the identity-bearing fields of a prescription to the two commitments
/// stored on the ledger. Issuance and validation both call build_snapshot, and
/// any change to the steps below is a protocol change that must bump
/// kProtocolVersion:
///
/// 1. patient_hash = BLAKE3(trim(name) || trim(age)); both must be non-empty.
/// 2. Each medicine keeps only {name, dosage, quantity}; name and dosage are
///    trimmed and an empty name is malformed.
/// 3. quantity: trimmed text, empty -> 0, full decimal parse floored,
///    unparseable -> 0; negative, non-finite or above 2^53 - 1 is malformed.
/// 4. Stable sort ascending by name using byte-wise comparison.
/// 5. Compact JSON array, fields in order name, dosage, quantity; the text
///    must be valid UTF-8.
/// 6. medication_hash = BLAKE3(serialized JSON bytes).
namespace rxseal::canonical {

inline constexpr auto kProtocolVersion = uint16_t{1};
inline constexpr auto kMaxCanonicalQuantity = uint64_t{9007199254740991};

struct canonical_medicine final {
  std::string name;
  std::string dosage;
  uint64_t quantity{};
};

struct snapshot final {
  uint16_t protocol_version{kProtocolVersion};
  std::vector<canonical_medicine> medicines;
  std::string serialized;
  rxseal::schema::hash32_t patient_hash{};
  rxseal::schema::hash32_t medication_hash{};
};

/// Strip leading and trailing ASCII whitespace.
std::string trim(std::string_view value);

std::optional<uint64_t> coerce_quantity(std::string_view raw,
                                        std::string& error);

/// Steps 2 to 4.
std::optional<std::vector<canonical_medicine>> canonicalize_medicines(
    const std::vector<rxseal::schema::medicine_entry_t>& medicines,
    std::string& error);

/// Step 5.
std::optional<std::string> serialize_medicines(
    const std::vector<canonical_medicine>& medicines,
    std::string& error);

std::optional<rxseal::schema::hash32_t> patient_identity_hash(
    std::string_view patient_name,
    std::string_view patient_age,
    std::string& error);

std::optional<rxseal::schema::hash32_t> medication_hash(
    const std::vector<rxseal::schema::medicine_entry_t>& medicines,
    std::string& error);

/// Run the whole protocol. On failure returns std::nullopt and leaves the
/// reason in `error`.
std::optional<snapshot> build_snapshot(
    std::string_view patient_name,
    std::string_view patient_age,
    const std::vector<rxseal::schema::medicine_entry_t>& medicines,
    std::string& error);

std::optional<snapshot> build_snapshot(
    const rxseal::schema::offchain_record_t& record,
    std::string& error);

/// Sum of canonical quantities, the quantity committed on the ledger.
uint64_t total_quantity(const snapshot& value);

}  // namespace rxseal::canonical
