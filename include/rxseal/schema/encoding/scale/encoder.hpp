#pragma once
#include <rxseal/common/critical.hpp>
#include <rxseal/schema/encoding/encoder.hpp>
#include <rxseal/schema/encoding/scale/ledger_call.hpp>
#include <rxseal/schema/encoding/scale/ledger_event.hpp>
#include <rxseal/schema/encoding/scale/ledger_operations.hpp>
#include <rxseal/schema/encoding/scale/ledger_receipt.hpp>
#include <rxseal/schema/encoding/scale/offchain_record.hpp>
#include <rxseal/schema/encoding/scale/prescription_record.hpp>
#include <rxseal/schema/encoding/scale/security_event_record.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace rxseal::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  rxseal::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, rxseal::schema::bytes_t& out);

  template <typename T>
  T decode(const rxseal::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const rxseal::schema::bytes_view_t& bytes);
};

using scale_encoder_t = encoder<scale_encoder_tag>;

template <typename T>
rxseal::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    rxseal::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        rxseal::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const rxseal::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    rxseal::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const rxseal::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace rxseal::schema::encoding
