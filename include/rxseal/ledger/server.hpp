#pragma once

#include <rxseal/ledger/v1/ledger.grpc.pb.h>
#include <rxseal/ledger/engine.hpp>

namespace rxseal::ledger {

/// gRPC callback listener exposing the ledger engine.
///
/// - Echo: liveness probe used by clients before reading state.
/// - Query: read-path route with SCALE encoded data and value.
/// - Submit: apply one SCALE encoded ledger call and return its receipt.
struct listener final : public rxseal::ledger::v1::Ledger::CallbackService {
  explicit listener(engine& ledger);

  virtual grpc::ServerUnaryReactor* Echo(
      grpc::CallbackServerContext* context,
      const rxseal::ledger::v1::RequestEcho* request,
      rxseal::ledger::v1::ResponseEcho* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const rxseal::ledger::v1::RequestQuery* request,
      rxseal::ledger::v1::ResponseQuery* response) override final;

  virtual grpc::ServerUnaryReactor* Submit(
      grpc::CallbackServerContext* context,
      const rxseal::ledger::v1::RequestSubmit* request,
      rxseal::ledger::v1::ResponseSubmit* response) override final;

  engine& ledger_engine_;
};

}  // namespace rxseal::ledger
