#pragma once

#include <rxseal/ledger/client.hpp>
#include <rxseal/ledger/engine.hpp>

namespace rxseal::ledger {

/// In-process client bound to an engine. Never fails at the transport level;
/// timeouts are ignored.
class local_client final : public client {
 public:
  explicit local_client(engine& ledger);

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
  engine& engine_;
};

}  // namespace rxseal::ledger
