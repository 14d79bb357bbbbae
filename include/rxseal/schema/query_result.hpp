#pragma once

#include <rxseal/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: query result.
// Prescription workflow: answer to one ledger read. `value` holds the SCALE
// encoded result of the route, `key` echoes the request data and `height` is
// the ledger height the read observed. A non-zero `code` is a
// query_error_code in `codespace`.
namespace rxseal::schema {

template <uint16_t Version>
struct query_result;

template <>
struct query_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  bytes_t key;
  bytes_t value;
  uint64_t height{};
  std::string codespace;
};

using query_result_t = query_result<1>;

}  // namespace rxseal::schema
