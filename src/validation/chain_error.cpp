#include <rxseal/schema/prescription_status.hpp>
#include <rxseal/validation/chain_error.hpp>

namespace rxseal::validation {

std::optional<std::string_view> chain_validation_error::find(
    const std::string_view key) const {
  for (const auto& [name, value] : context) {
    if (name == key) {
      return std::string_view{value};
    }
  }
  return std::nullopt;
}

std::string user_reason(const chain_validation_error& error) {
  using enum rxseal::schema::chain_error_code;
  switch (error.code) {
    case chain_unreachable:
      return "ledger unavailable, try again later";
    case not_found_on_chain:
      return "prescription not found on ledger";
    case status_mismatch: {
      auto actual = error.find("actual");
      if (actual == rxseal::schema::to_string(
                        rxseal::schema::prescription_status_t::used)) {
        return "already dispensed";
      }
      if (actual == rxseal::schema::to_string(
                        rxseal::schema::prescription_status_t::expired)) {
        return "expired";
      }
      return "prescription not active";
    }
    case usage_exhausted:
      return "already dispensed";
    case expired_on_chain:
      return "expired";
    case hash_mismatch:
      return "data integrity check failed";
  }
  return "validation failed";
}

std::string format_context(const context_t& context) {
  auto out = std::string{};
  for (const auto& [key, value] : context) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(key).append("=").append(value);
  }
  return out;
}

}  // namespace rxseal::validation
