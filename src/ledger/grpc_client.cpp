#include <rxseal/ledger/grpc_client.hpp>
#include <rxseal/schema/encoding/scale/encoder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <iterator>

using namespace rxseal::schema;

namespace rxseal::ledger {

namespace {

void set_deadline(grpc::ClientContext& context,
                  const std::chrono::milliseconds timeout) {
  context.set_deadline(std::chrono::system_clock::now() + timeout);
  context.set_wait_for_ready(false);
}

std::string describe(const grpc::Status& status) {
  return fmt::format("gRPC status {}: {}",
                     static_cast<int>(status.error_code()),
                     status.error_message());
}

}  // namespace

std::string normalize_endpoint(std::string_view url) {
  static constexpr auto kSchemes = std::array{
      std::string_view{"http://"}, std::string_view{"https://"},
      std::string_view{"grpc://"}};
  for (const auto scheme : kSchemes) {
    if (url.starts_with(scheme)) {
      url.remove_prefix(scheme.size());
      break;
    }
  }
  while (url.ends_with('/')) {
    url.remove_suffix(1);
  }
  return std::string{url};
}

grpc_client::grpc_client(const std::string_view endpoint)
    : endpoint_{normalize_endpoint(endpoint)},
      channel_{grpc::CreateChannel(endpoint_,
                                   grpc::InsecureChannelCredentials())},
      stub_{rxseal::ledger::v1::Ledger::NewStub(channel_)} {}

bool grpc_client::ping(const std::chrono::milliseconds timeout,
                       std::string& error) {
  auto context = grpc::ClientContext{};
  set_deadline(context, timeout);
  auto request = rxseal::ledger::v1::RequestEcho{};
  request.set_message("ping");
  auto response = rxseal::ledger::v1::ResponseEcho{};
  auto status = stub_->Echo(&context, request, &response);
  if (!status.ok()) {
    error = describe(status);
    spdlog::debug("Ledger ping to {} failed: {}", endpoint_, error);
    return false;
  }
  return true;
}

std::optional<query_result_t> grpc_client::query(
    const std::string_view path,
    const bytes_view_t& data,
    const std::chrono::milliseconds timeout,
    std::string& error) {
  auto context = grpc::ClientContext{};
  set_deadline(context, timeout);
  auto request = rxseal::ledger::v1::RequestQuery{};
  request.set_path(std::string{path});
  request.set_data(make_string(data));
  auto response = rxseal::ledger::v1::ResponseQuery{};
  auto status = stub_->Query(&context, request, &response);
  if (!status.ok()) {
    error = describe(status);
    spdlog::debug("Ledger query {} to {} failed: {}", path, endpoint_, error);
    return std::nullopt;
  }
  return query_result_t{.code = response.code(),
                        .log = response.log(),
                        .info = response.info(),
                        .key = make_bytes(response.key()),
                        .value = make_bytes(response.value()),
                        .height = response.height(),
                        .codespace = response.codespace()};
}

ledger_receipt_t grpc_client::submit(const ledger_call_t& call,
                                     const std::chrono::milliseconds timeout) {
  auto encoder = encoding::scale_encoder_t{};
  auto encoded = encoder.encode(call);

  auto context = grpc::ClientContext{};
  set_deadline(context, timeout);
  auto request = rxseal::ledger::v1::RequestSubmit{};
  request.set_call(make_string(encoded));
  auto response = rxseal::ledger::v1::ResponseSubmit{};
  auto status = stub_->Submit(&context, request, &response);
  if (!status.ok()) {
    auto message = describe(status);
    spdlog::error("Ledger submit to {} failed: {}", endpoint_, message);
    return make_transport_failure(std::move(message));
  }

  auto receipt = ledger_receipt_t{.code = response.code(),
                                  .log = response.log(),
                                  .info = response.info(),
                                  .codespace = response.codespace(),
                                  .height = response.height()};
  if (response.call_hash().size() == receipt.call_hash.size()) {
    std::copy_n(std::begin(response.call_hash()), receipt.call_hash.size(),
                std::begin(receipt.call_hash));
  }
  for (const auto& event : response.events()) {
    auto converted = ledger_event_t{.type = event.type()};
    for (const auto& attribute : event.attributes()) {
      converted.attributes.push_back(
          ledger_event_attribute_t{.key = attribute.key(),
                                   .value = attribute.value(),
                                   .index = attribute.index()});
    }
    receipt.events.push_back(std::move(converted));
  }
  return receipt;
}

}  // namespace rxseal::ledger
