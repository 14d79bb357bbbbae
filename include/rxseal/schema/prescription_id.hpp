#pragma once

#include <rxseal/schema/primitives.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

// Prescription identifiers are short uppercase alphanumeric codes stored on
// the ledger as 32 bytes: the code's bytes right-padded with zeros. The last
// byte is always zero, so a code holds at most 31 characters.
namespace rxseal::schema {

inline constexpr auto kMaxShortCodeLength = std::size_t{31};
inline constexpr auto kGeneratedShortCodeLength = std::size_t{6};

bool is_valid_short_code(std::string_view code);

std::optional<prescription_id_t> try_encode_prescription_id(
    std::string_view code);

/// Inverse of try_encode_prescription_id. Fails for the zero id, for ids with
/// bytes after the terminator, and for ids that do not carry a valid code.
std::optional<std::string> try_decode_prescription_id(
    const prescription_id_t& id);

/// Short code for display and logs; falls back to hex for foreign ids.
std::string describe_prescription_id(const prescription_id_t& id);

/// Generate a 6 character uppercase hex code from issuance details.
std::string make_short_code(std::string_view patient_name,
                            std::string_view patient_age,
                            timestamp_milliseconds_t issued_at);

}  // namespace rxseal::schema
