#include <rxseal/ledger/keys.hpp>

#include <boost/endian/buffers.hpp>

#include <iterator>

namespace rxseal::ledger::keys {

namespace {

rxseal::schema::bytes_t make_prefixed(
    const std::string_view prefix,
    const rxseal::schema::bytes_view_t& suffix) {
  auto key = rxseal::schema::make_bytes(prefix);
  key.insert(std::end(key), std::begin(suffix), std::end(suffix));
  return key;
}

}  // namespace

rxseal::schema::bytes_t make_key(const std::string_view fixed_key) {
  return rxseal::schema::make_bytes(fixed_key);
}

rxseal::schema::bytes_t make_prescription_key(
    const rxseal::schema::prescription_id_t& id) {
  return make_prefixed(kPrescriptionPrefix, id);
}

rxseal::schema::bytes_t make_role_key(
    const rxseal::schema::role_id_t role,
    const rxseal::schema::account_id_t& account) {
  auto key = rxseal::schema::make_bytes(kRolePrefix);
  key.push_back(static_cast<uint8_t>(role));
  key.push_back(static_cast<uint8_t>('|'));
  key.insert(std::end(key), std::begin(account), std::end(account));
  return key;
}

rxseal::schema::bytes_t make_nonce_key(
    const rxseal::schema::account_id_t& account) {
  return make_prefixed(kNoncePrefix, account);
}

rxseal::schema::bytes_t make_event_key(const uint64_t event_id) {
  auto ordered = boost::endian::big_uint64_buf_t{event_id};
  return make_prefixed(
      kEventPrefix,
      rxseal::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(ordered.data()), sizeof(ordered)});
}

}  // namespace rxseal::ledger::keys
