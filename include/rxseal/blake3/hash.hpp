#pragma once
#include <rxseal/schema/primitives.hpp>
#include <string_view>

namespace rxseal::blake3 {

rxseal::schema::hash32_t hash(const std::string_view& str);
rxseal::schema::hash32_t hash(const rxseal::schema::bytes_view_t& bytes);

}  // namespace rxseal::blake3
