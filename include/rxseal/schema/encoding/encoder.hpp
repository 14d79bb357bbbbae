#pragma once
#include <rxseal/schema/primitives.hpp>
#include <optional>
#include <span>

namespace rxseal::schema::encoding {

/// Encoder selected at build time by tag; the SCALE specialization is the only
/// one in use.
template <typename Library>
struct encoder {
  template <typename T>
  rxseal::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, rxseal::schema::bytes_t& out);

  template <typename T>
  T decode(const rxseal::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const rxseal::schema::bytes_view_t& bytes);
};

}  // namespace rxseal::schema::encoding
