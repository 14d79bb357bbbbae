#include <spdlog/spdlog.h>
#include <rxseal/ledger/server.hpp>

using namespace rxseal::schema;

namespace rxseal::ledger {

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

}  // namespace

listener::listener(engine& ledger) : ledger_engine_{ledger} {}

grpc::ServerUnaryReactor* listener::Echo(
    grpc::CallbackServerContext* context,
    const rxseal::ledger::v1::RequestEcho* request,
    rxseal::ledger::v1::ResponseEcho* response) {
  response->set_message(request->message());
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const rxseal::ledger::v1::RequestQuery* request,
    rxseal::ledger::v1::ResponseQuery* response) {
  auto result = ledger_engine_.query(request->path(),
                                     make_bytes_view(request->data()));
  response->set_code(result.code);
  response->set_log(result.log);
  response->set_info(result.info);
  response->set_key(make_string(result.key));
  response->set_value(make_string(result.value));
  response->set_height(result.height);
  response->set_codespace(result.codespace);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Submit(
    grpc::CallbackServerContext* context,
    const rxseal::ledger::v1::RequestSubmit* request,
    rxseal::ledger::v1::ResponseSubmit* response) {
  auto receipt = ledger_engine_.submit(make_bytes_view(request->call()));
  response->set_code(receipt.code);
  response->set_log(receipt.log);
  response->set_info(receipt.info);
  response->set_codespace(receipt.codespace);
  response->set_height(receipt.height);
  response->set_call_hash(
      make_string(bytes_view_t{receipt.call_hash.data(),
                               receipt.call_hash.size()}));
  for (const auto& event : receipt.events) {
    auto* converted = response->add_events();
    converted->set_type(event.type);
    for (const auto& attribute : event.attributes) {
      auto* out = converted->add_attributes();
      out->set_key(attribute.key);
      out->set_value(attribute.value);
      out->set_index(attribute.index);
    }
  }
  if (receipt.code != 0) {
    spdlog::debug("Submit returned code {} ({})", receipt.code, receipt.log);
  }
  return finish_ok(context);
}

}  // namespace rxseal::ledger
