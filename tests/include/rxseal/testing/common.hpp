#pragma once

#include <rxseal/common/clock.hpp>
#include <rxseal/common/critical.hpp>
#include <rxseal/crypto/signing_key.hpp>
#include <rxseal/schema/medicine_entry.hpp>
#include <rxseal/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace rxseal::testing {

/// 2023-11-14T22:13:20Z.
inline constexpr auto kStartTime =
    rxseal::schema::timestamp_seconds_t{1'700'000'000};
inline constexpr auto kOneDay = rxseal::schema::timestamp_seconds_t{86'400};

inline rxseal::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = rxseal::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline rxseal::crypto::signing_key make_key(const uint8_t seed) {
  auto key = rxseal::crypto::signing_key::from_seed(make_hash(seed));
  if (!key) {
    rxseal::common::critical("failed to derive test signing key");
  }
  return *key;
}

inline rxseal::schema::account_id_t make_account(
    const rxseal::crypto::signing_key& key) {
  return rxseal::crypto::make_account_id(key.public_key());
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Settable unix clock shared by every copy of `function()`.
class manual_clock final {
 public:
  explicit manual_clock(const rxseal::schema::timestamp_seconds_t start)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  rxseal::common::unix_clock_t function() const {
    return [now = now_] { return now->load(); };
  }

  rxseal::schema::timestamp_seconds_t now() const { return now_->load(); }
  void set(const rxseal::schema::timestamp_seconds_t value) {
    now_->store(value);
  }
  void advance(const rxseal::schema::timestamp_seconds_t seconds) {
    now_->fetch_add(seconds);
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

inline std::vector<rxseal::schema::medicine_entry_t> make_medicines() {
  return {
      rxseal::schema::medicine_entry_t{.name = "Paracetamol",
                                       .dosage = "500mg",
                                       .quantity = "10",
                                       .instructions = "after meals"},
      rxseal::schema::medicine_entry_t{.name = "Amoxicillin",
                                       .dosage = "250mg",
                                       .quantity = "21",
                                       .instructions = "three times a day"},
  };
}

}  // namespace rxseal::testing
