#include <rxseal/ledger/local_client.hpp>

namespace rxseal::ledger {

local_client::local_client(engine& ledger) : engine_{ledger} {}

bool local_client::ping(std::chrono::milliseconds, std::string&) {
  return true;
}

std::optional<rxseal::schema::query_result_t> local_client::query(
    const std::string_view path,
    const rxseal::schema::bytes_view_t& data,
    std::chrono::milliseconds,
    std::string&) {
  return engine_.query(path, data);
}

rxseal::schema::ledger_receipt_t local_client::submit(
    const rxseal::schema::ledger_call_t& call,
    std::chrono::milliseconds) {
  return engine_.submit(call);
}

}  // namespace rxseal::ledger
