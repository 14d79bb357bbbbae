#pragma once

#include <rxseal/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: query error code.
// Prescription workflow: ledger read-path refusals. A missing prescription is
// not an error; `/prescription` answers with a zero record instead.
namespace rxseal::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  unsupported_path = 3,
};

inline constexpr auto kQueryErrorCodeMappings = std::array{
    std::pair<std::string_view, query_error_code>{
        "invalid_key", query_error_code::invalid_key},
    std::pair<std::string_view, query_error_code>{
        "unsupported_path", query_error_code::unsupported_path},
};

template <>
inline std::optional<query_error_code> try_from_string<query_error_code>(
    const std::string_view value) {
  return from_string(value, kQueryErrorCodeMappings);
}

inline constexpr std::string_view to_string(const query_error_code value) {
  return to_string_or(value, kQueryErrorCodeMappings, "unknown");
}

}  // namespace rxseal::schema
