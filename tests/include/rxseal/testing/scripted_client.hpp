#pragma once

#include <rxseal/ledger/client.hpp>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace rxseal::testing {

/// Client wrapper that can fail pings or queries and counts every call.
class scripted_client final : public rxseal::ledger::client {
 public:
  explicit scripted_client(rxseal::ledger::client& inner) : inner_{inner} {}

  bool fail_ping{};
  bool fail_query{};
  std::string failure_message{"connection refused"};
  std::size_t ping_calls{};
  std::size_t query_calls{};
  std::size_t submit_calls{};

  bool ping(const std::chrono::milliseconds timeout,
            std::string& error) override {
    ++ping_calls;
    if (fail_ping) {
      error = failure_message;
      return false;
    }
    return inner_.ping(timeout, error);
  }

  std::optional<rxseal::schema::query_result_t> query(
      const std::string_view path,
      const rxseal::schema::bytes_view_t& data,
      const std::chrono::milliseconds timeout,
      std::string& error) override {
    ++query_calls;
    if (fail_query) {
      error = failure_message;
      return std::nullopt;
    }
    return inner_.query(path, data, timeout, error);
  }

  rxseal::schema::ledger_receipt_t submit(
      const rxseal::schema::ledger_call_t& call,
      const std::chrono::milliseconds timeout) override {
    ++submit_calls;
    return inner_.submit(call, timeout);
  }

 private:
  rxseal::ledger::client& inner_;
};

}  // namespace rxseal::testing
