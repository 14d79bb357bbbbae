#include <blake3.h>
#include <rxseal/blake3/hash.hpp>

namespace rxseal::blake3 {

namespace {

rxseal::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, data, size);
  auto output = rxseal::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<rxseal::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace

rxseal::schema::hash32_t hash(const std::string_view& str) {
  return digest(str.data(), str.size());
}

rxseal::schema::hash32_t hash(const rxseal::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

}  // namespace rxseal::blake3
