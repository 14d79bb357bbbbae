#pragma once

#include <grpcpp/grpcpp.h>
#include <rxseal/ledger/v1/ledger.grpc.pb.h>
#include <rxseal/ledger/client.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace rxseal::ledger {

/// Strip an `http://`, `https://` or `grpc://` scheme and any trailing slash
/// so configured RPC URLs can be used as gRPC targets.
std::string normalize_endpoint(std::string_view url);

/// Client for a remote `rxseal-ledgerd` over an insecure gRPC channel. Every
/// RPC carries a deadline of `timeout` from the moment it is issued and does
/// not wait for the channel to become ready.
class grpc_client final : public client {
 public:
  explicit grpc_client(std::string_view endpoint);

  const std::string& endpoint() const { return endpoint_; }

  bool ping(std::chrono::milliseconds timeout, std::string& error) override;

  std::optional<rxseal::schema::query_result_t> query(
      std::string_view path,
      const rxseal::schema::bytes_view_t& data,
      std::chrono::milliseconds timeout,
      std::string& error) override;

  rxseal::schema::ledger_receipt_t submit(
      const rxseal::schema::ledger_call_t& call,
      std::chrono::milliseconds timeout) override;

 private:
  std::string endpoint_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<rxseal::ledger::v1::Ledger::Stub> stub_;
};

}  // namespace rxseal::ledger
