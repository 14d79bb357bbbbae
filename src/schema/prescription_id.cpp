#include <rxseal/blake3/hash.hpp>
#include <rxseal/schema/prescription_id.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>

#include <fmt/format.h>

namespace rxseal::schema {

namespace {

bool is_short_code_char(const char c) {
  return (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

}  // namespace

bool is_valid_short_code(const std::string_view code) {
  if (code.empty() || code.size() > kMaxShortCodeLength) {
    return false;
  }
  return std::ranges::all_of(code, is_short_code_char);
}

std::optional<prescription_id_t> try_encode_prescription_id(
    const std::string_view code) {
  if (!is_valid_short_code(code)) {
    return std::nullopt;
  }
  auto id = prescription_id_t{};
  std::copy(std::begin(code), std::end(code), std::begin(id));
  return id;
}

std::optional<std::string> try_decode_prescription_id(
    const prescription_id_t& id) {
  auto terminator = std::ranges::find(id, uint8_t{0});
  if (terminator == std::end(id)) {
    return std::nullopt;
  }
  if (!std::all_of(terminator, std::end(id),
                   [](const uint8_t b) { return b == 0; })) {
    return std::nullopt;
  }
  auto code = std::string{reinterpret_cast<const char*>(id.data()),
                          static_cast<std::size_t>(
                              std::distance(std::begin(id), terminator))};
  if (!is_valid_short_code(code)) {
    return std::nullopt;
  }
  return code;
}

std::string describe_prescription_id(const prescription_id_t& id) {
  auto code = try_decode_prescription_id(id);
  if (code) {
    return *code;
  }
  return to_prefixed_hex(id);
}

std::string make_short_code(const std::string_view patient_name,
                            const std::string_view patient_age,
                            const timestamp_milliseconds_t issued_at) {
  auto digest = rxseal::blake3::hash(
      fmt::format("{}-{}-{}", patient_name, patient_age, issued_at));
  auto hex = to_hex(bytes_view_t{digest.data(), 3});
  std::ranges::transform(hex, std::begin(hex), [](const char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  return hex;
}

}  // namespace rxseal::schema
