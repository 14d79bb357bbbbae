#pragma once

#include <rxseal/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: chain error code.
// Prescription workflow: the six ways a validation gate run can reject an
// off-chain mutation, in check order.
namespace rxseal::schema {

enum class chain_error_code : uint8_t {
  chain_unreachable = 1,
  not_found_on_chain = 2,
  status_mismatch = 3,
  usage_exhausted = 4,
  expired_on_chain = 5,
  hash_mismatch = 6,
};

inline constexpr auto kChainErrorCodeMappings = std::array{
    std::pair<std::string_view, chain_error_code>{
        "CHAIN_UNREACHABLE", chain_error_code::chain_unreachable},
    std::pair<std::string_view, chain_error_code>{
        "NOT_FOUND_ON_CHAIN", chain_error_code::not_found_on_chain},
    std::pair<std::string_view, chain_error_code>{
        "STATUS_MISMATCH", chain_error_code::status_mismatch},
    std::pair<std::string_view, chain_error_code>{
        "USAGE_EXHAUSTED", chain_error_code::usage_exhausted},
    std::pair<std::string_view, chain_error_code>{
        "EXPIRED_ON_CHAIN", chain_error_code::expired_on_chain},
    std::pair<std::string_view, chain_error_code>{
        "HASH_MISMATCH", chain_error_code::hash_mismatch},
};

template <>
inline std::optional<chain_error_code> try_from_string<chain_error_code>(
    const std::string_view value) {
  return from_string(value, kChainErrorCodeMappings);
}

inline constexpr std::string_view to_string(const chain_error_code value) {
  return to_string_or(value, kChainErrorCodeMappings, "UNKNOWN");
}

}  // namespace rxseal::schema
