#include <gtest/gtest.h>
#include <rxseal/offchain/record_store.hpp>
#include <rxseal/schema/ledger_error_code.hpp>
#include <rxseal/schema/prescription_id.hpp>
#include <rxseal/service/prescription_service.hpp>
#include <rxseal/testing/ledger_fixture.hpp>
#include <rxseal/testing/scripted_client.hpp>

#include <memory>
#include <string>

using namespace rxseal::schema;
using rxseal::service::service_error;
using rxseal::service::service_error_code;
using rxseal::testing::kOneDay;
using rxseal::testing::kStartTime;
using rxseal::testing::kTestTimeout;

namespace {

/// Ledger, off-chain store and service wired the way rxseal-tool wires them,
/// with a scripted client in between to simulate outages.
struct service_fixture final {
  explicit service_fixture(const std::string_view prefix)
      : ledger{prefix},
        offchain_path{rxseal::testing::make_db_path(std::string{prefix} +
                                                    "_offchain")},
        offchain_storage{std::make_unique<rxseal::storage::rocksdb_storage_t>(
            rxseal::storage::make_storage<rxseal::storage::rocksdb_storage_tag>(
                offchain_path))},
        records{std::make_unique<rxseal::offchain::record_store>(
            encoder, *offchain_storage)},
        client{*ledger.client},
        service{std::make_unique<rxseal::service::prescription_service>(
            client, *records,
            rxseal::validation::gate_options{.endpoint = "127.0.0.1:8545",
                                             .timeout = kTestTimeout},
            ledger.clock.function())} {
    ledger.register_roles();
  }

  ~service_fixture() {
    service.reset();
    records.reset();
    offchain_storage.reset();
    rxseal::testing::remove_path(offchain_path);
  }

  rxseal::service::issue_request make_request(
      const std::string_view code,
      const uint32_t max_usage = 1) const {
    return rxseal::service::issue_request{
        .short_code = std::string{code},
        .patient_name = "Jane Doe",
        .patient_age = "42",
        .medicines = rxseal::testing::make_medicines(),
        .notes = "no alcohol",
        .max_usage = max_usage,
        .expiry_date = ledger.clock.now() + kOneDay};
  }

  rxseal::service::mutation_result issue(const std::string_view code,
                                         const uint32_t max_usage = 1) {
    auto result = service->issue(make_request(code, max_usage),
                                 ledger.doctor_key);
    if (auto failure = std::get_if<service_error>(&result)) {
      ADD_FAILURE() << "issue failed: " << failure->message;
      return {};
    }
    return std::get<rxseal::service::mutation_result>(std::move(result));
  }

  /// Overwrite the stored record, bypassing the store's field guards.
  void tamper(const std::string_view code,
              const rxseal::offchain::record_mutation_t& mutate) {
    auto record = records->find(code);
    ASSERT_TRUE(record.has_value());
    mutate(*record);
    offchain_storage->put(encoder, rxseal::offchain::make_record_key(code),
                          *record);
  }

  std::size_t count_events(const security_event_type_t type) const {
    auto count = std::size_t{0};
    for (const auto& event : records->security_events()) {
      if (event.type == type) {
        ++count;
      }
    }
    return count;
  }

  rxseal::testing::ledger_fixture ledger;
  std::string offchain_path;
  rxseal::schema::encoding::scale_encoder_t encoder;
  std::unique_ptr<rxseal::storage::rocksdb_storage_t> offchain_storage;
  std::unique_ptr<rxseal::offchain::record_store> records;
  rxseal::testing::scripted_client client;
  std::unique_ptr<rxseal::service::prescription_service> service;
};

const service_error& error_of(const auto& result) {
  return std::get<service_error>(result);
}

}  // namespace

TEST(prescription_service, issue_commits_ledger_then_store) {
  auto fixture = service_fixture{"rxseal_service_issue"};
  auto issued = fixture.issue("RXP001");
  EXPECT_EQ(issued.receipt.code, 0u);
  EXPECT_EQ(issued.record.status, offchain_status_t::active);
  EXPECT_TRUE(issued.record.ledger_synced);
  EXPECT_EQ(issued.record.issued_at, kStartTime);

  auto stored = fixture.records->find("RXP001");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->doctor, rxseal::testing::make_account(
                                fixture.ledger.doctor_key));
  EXPECT_EQ(stored->notes, "no alcohol");

  auto on_ledger = fixture.ledger.engine->get_prescription(
      try_encode_prescription_id("RXP001").value());
  auto snapshot = rxseal::testing::make_snapshot();
  EXPECT_EQ(on_ledger.patient_hash, snapshot.patient_hash);
  EXPECT_EQ(on_ledger.medication_hash, snapshot.medication_hash);
  EXPECT_EQ(on_ledger.quantity, 31u);
}

TEST(prescription_service, issue_generates_short_code) {
  auto fixture = service_fixture{"rxseal_service_generated_code"};
  auto result = fixture.service->issue(fixture.make_request(""),
                                       fixture.ledger.doctor_key);
  ASSERT_TRUE(std::holds_alternative<rxseal::service::mutation_result>(result))
      << error_of(result).message;
  const auto& code =
      std::get<rxseal::service::mutation_result>(result).record.short_code;
  EXPECT_EQ(code.size(), kGeneratedShortCodeLength);
  EXPECT_TRUE(is_valid_short_code(code));
  EXPECT_TRUE(fixture.records->find(code).has_value());
}

TEST(prescription_service, malformed_issue_never_reaches_ledger) {
  auto fixture = service_fixture{"rxseal_service_malformed"};
  auto height = fixture.ledger.engine->height();

  auto request = fixture.make_request("RXP002");
  request.patient_name = "   ";
  auto result = fixture.service->issue(request, fixture.ledger.doctor_key);
  ASSERT_TRUE(std::holds_alternative<service_error>(result));
  EXPECT_EQ(error_of(result).code, service_error_code::malformed_input);
  EXPECT_EQ(error_of(result).http_status, 400);

  request = fixture.make_request("RXP002");
  request.medicines.clear();
  EXPECT_EQ(error_of(fixture.service->issue(request, fixture.ledger.doctor_key))
                .http_status,
            400);

  request = fixture.make_request("RXP002");
  request.medicines[0].quantity = "-3";
  EXPECT_EQ(error_of(fixture.service->issue(request, fixture.ledger.doctor_key))
                .code,
            service_error_code::malformed_input);

  EXPECT_EQ(fixture.ledger.engine->height(), height);
  EXPECT_EQ(fixture.client.submit_calls, 0u);
  EXPECT_FALSE(fixture.records->find("RXP002").has_value());
}

TEST(prescription_service, duplicate_issue_is_conflict) {
  auto fixture = service_fixture{"rxseal_service_duplicate"};
  fixture.issue("RXP003");
  auto result = fixture.service->issue(fixture.make_request("RXP003"),
                                       fixture.ledger.doctor_key);
  ASSERT_TRUE(std::holds_alternative<service_error>(result));
  EXPECT_EQ(error_of(result).code, service_error_code::invalid_state);
  EXPECT_EQ(error_of(result).http_status, 409);
}

TEST(prescription_service, issue_refused_by_ledger_stores_nothing) {
  auto fixture = service_fixture{"rxseal_service_issue_refused"};
  auto result = fixture.service->issue(fixture.make_request("RXP004"),
                                       fixture.ledger.pharmacy_key);
  ASSERT_TRUE(std::holds_alternative<service_error>(result));
  const auto& error = error_of(result);
  EXPECT_EQ(error.code, service_error_code::ledger_refused);
  EXPECT_EQ(error.http_status, 403);
  ASSERT_TRUE(error.receipt.has_value());
  EXPECT_EQ(error.receipt->code,
            static_cast<uint32_t>(ledger_error_code::not_doctor));
  EXPECT_FALSE(fixture.records->find("RXP004").has_value());
  EXPECT_EQ(fixture.count_events(security_event_type_t::ledger_refused), 1u);
}

TEST(prescription_service, single_use_dispense_then_replay_is_blocked) {
  auto fixture = service_fixture{"rxseal_service_single_use"};
  fixture.issue("RXP005");
  fixture.ledger.clock.advance(60);

  auto first =
      fixture.service->dispense("RXP005", fixture.ledger.pharmacy_key);
  ASSERT_TRUE(std::holds_alternative<rxseal::service::mutation_result>(first))
      << error_of(first).message;
  const auto& dispensed =
      std::get<rxseal::service::mutation_result>(first).record;
  EXPECT_EQ(dispensed.status, offchain_status_t::used);
  EXPECT_EQ(dispensed.usage_count, 1u);
  EXPECT_EQ(dispensed.dispensed_at, kStartTime + 60);
  EXPECT_EQ(dispensed.hash_verified, true);

  auto submits = fixture.client.submit_calls;
  auto replay =
      fixture.service->dispense("RXP005", fixture.ledger.pharmacy_key);
  ASSERT_TRUE(std::holds_alternative<service_error>(replay));
  const auto& error = error_of(replay);
  EXPECT_EQ(error.code, service_error_code::validation_rejected);
  EXPECT_EQ(error.http_status, 403);
  EXPECT_EQ(error.message, "already dispensed");
  ASSERT_TRUE(error.chain_error.has_value());
  EXPECT_EQ(error.chain_error->code, chain_error_code::status_mismatch);
  EXPECT_EQ(fixture.client.submit_calls, submits);
  EXPECT_EQ(fixture.count_events(security_event_type_t::validation_rejected),
            1u);
}

TEST(prescription_service, multi_use_dispense_cycles_through_dispensed) {
  auto fixture = service_fixture{"rxseal_service_multi_use"};
  fixture.issue("RXP006", 2);

  auto first =
      fixture.service->dispense("RXP006", fixture.ledger.pharmacy_key);
  ASSERT_TRUE(std::holds_alternative<rxseal::service::mutation_result>(first))
      << error_of(first).message;
  EXPECT_EQ(std::get<rxseal::service::mutation_result>(first).record.status,
            offchain_status_t::dispensed);
  EXPECT_EQ(
      std::get<rxseal::service::mutation_result>(first).record.usage_count,
      1u);

  auto second =
      fixture.service->dispense("RXP006", fixture.ledger.pharmacy_key);
  ASSERT_TRUE(std::holds_alternative<rxseal::service::mutation_result>(second))
      << error_of(second).message;
  EXPECT_EQ(std::get<rxseal::service::mutation_result>(second).record.status,
            offchain_status_t::used);
  EXPECT_EQ(
      std::get<rxseal::service::mutation_result>(second).record.usage_count,
      2u);
}

TEST(prescription_service, unreachable_ledger_blocks_dispense) {
  auto fixture = service_fixture{"rxseal_service_unreachable"};
  fixture.issue("RXP007");
  fixture.client.fail_ping = true;
  auto submits = fixture.client.submit_calls;

  auto result =
      fixture.service->dispense("RXP007", fixture.ledger.pharmacy_key);
  ASSERT_TRUE(std::holds_alternative<service_error>(result));
  EXPECT_EQ(error_of(result).http_status, 503);
  EXPECT_EQ(error_of(result).message, "ledger unavailable, try again later");
  EXPECT_EQ(fixture.client.submit_calls, submits);
  EXPECT_EQ(fixture.records->find("RXP007")->status,
            offchain_status_t::active);
  EXPECT_EQ(fixture.count_events(security_event_type_t::ledger_unreachable),
            1u);
}

TEST(prescription_service, tampered_record_is_flagged_unverified) {
  auto fixture = service_fixture{"rxseal_service_tampered"};
  fixture.issue("RXP008");
  fixture.tamper("RXP008", [](offchain_record_t& record) {
    record.medicines[0].dosage = "1000mg";
  });

  auto result =
      fixture.service->dispense("RXP008", fixture.ledger.pharmacy_key);
  ASSERT_TRUE(std::holds_alternative<service_error>(result));
  const auto& error = error_of(result);
  EXPECT_EQ(error.http_status, 403);
  EXPECT_EQ(error.message, "data integrity check failed");
  ASSERT_TRUE(error.chain_error.has_value());
  EXPECT_EQ(error.chain_error->find("patientMatch"), "true");
  EXPECT_EQ(error.chain_error->find("medMatch"), "false");

  auto stored = fixture.records->find("RXP008");
  EXPECT_EQ(stored->hash_verified, false);
  EXPECT_EQ(stored->status, offchain_status_t::active);
  auto events = fixture.records->security_events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].type, security_event_type_t::hash_mismatch);
  EXPECT_EQ(events[0].severity, security_event_severity_t::critical);
  EXPECT_EQ(events[0].code, "HASH_MISMATCH");
}

TEST(prescription_service, quantity_edit_after_issue_is_a_hash_mismatch) {
  auto fixture = service_fixture{"rxseal_service_quantity_edit"};
  fixture.issue("RXP019");
  fixture.tamper("RXP019", [](offchain_record_t& record) {
    record.medicines[0].quantity = "20";
  });

  auto result =
      fixture.service->dispense("RXP019", fixture.ledger.pharmacy_key);
  ASSERT_TRUE(std::holds_alternative<service_error>(result));
  const auto& error = error_of(result);
  EXPECT_EQ(error.http_status, 403);
  ASSERT_TRUE(error.chain_error.has_value());
  EXPECT_EQ(error.chain_error->code, chain_error_code::hash_mismatch);
  EXPECT_EQ(error.chain_error->find("patientMatch"), "true");
  EXPECT_EQ(error.chain_error->find("medMatch"), "false");
  EXPECT_EQ(fixture.records->find("RXP019")->hash_verified, false);
}

TEST(prescription_service, expiry_on_ledger_expires_offchain_record) {
  auto fixture = service_fixture{"rxseal_service_expired"};
  fixture.issue("RXP009");
  fixture.ledger.clock.advance(2 * kOneDay);

  auto result =
      fixture.service->dispense("RXP009", fixture.ledger.pharmacy_key);
  ASSERT_TRUE(std::holds_alternative<service_error>(result));
  EXPECT_EQ(error_of(result).message, "expired");
  EXPECT_EQ(error_of(result).chain_error->code,
            chain_error_code::expired_on_chain);
  EXPECT_EQ(fixture.records->find("RXP009")->status,
            offchain_status_t::expired);
}

TEST(prescription_service, dispense_by_non_pharmacy_rolls_back) {
  auto fixture = service_fixture{"rxseal_service_not_pharmacy"};
  fixture.issue("RXP010");

  auto result = fixture.service->dispense("RXP010", fixture.ledger.doctor_key);
  ASSERT_TRUE(std::holds_alternative<service_error>(result));
  EXPECT_EQ(error_of(result).code, service_error_code::ledger_refused);
  EXPECT_EQ(error_of(result).http_status, 403);
  EXPECT_EQ(fixture.records->find("RXP010")->status,
            offchain_status_t::active);
  EXPECT_EQ(fixture.ledger.engine
                ->get_prescription(try_encode_prescription_id("RXP010").value())
                .usage_count,
            0u);
}

TEST(prescription_service, refused_repeat_dispense_stays_dispensed) {
  auto fixture = service_fixture{"rxseal_service_repeat_refused"};
  fixture.issue("RXP020", 3);
  auto first = fixture.service->dispense("RXP020", fixture.ledger.pharmacy_key);
  ASSERT_TRUE(std::holds_alternative<rxseal::service::mutation_result>(first));

  auto result = fixture.service->dispense("RXP020", fixture.ledger.doctor_key);
  ASSERT_TRUE(std::holds_alternative<service_error>(result));
  EXPECT_EQ(error_of(result).code, service_error_code::ledger_refused);
  auto stored = fixture.records->find("RXP020");
  EXPECT_EQ(stored->status, offchain_status_t::dispensed);
  EXPECT_EQ(stored->usage_count, 1u);
}

TEST(prescription_service, resolve_pending_commits_dispense_seen_on_ledger) {
  auto fixture = service_fixture{"rxseal_service_resolve_commit"};
  fixture.issue("RXP021", 2);
  auto receipt = fixture.ledger.submit(
      fixture.ledger.pharmacy_key,
      dispense_prescription_t{
          .id = try_encode_prescription_id("RXP021").value()});
  ASSERT_EQ(receipt.code, 0u) << receipt.log;
  fixture.tamper("RXP021", [](offchain_record_t& record) {
    record.status = offchain_status_t::pending_dispense;
  });

  auto result = fixture.service->resolve_pending("RXP021");
  ASSERT_TRUE(std::holds_alternative<offchain_record_t>(result));
  const auto& resolved = std::get<offchain_record_t>(result);
  EXPECT_EQ(resolved.status, offchain_status_t::dispensed);
  EXPECT_EQ(resolved.usage_count, 1u);
  EXPECT_EQ(resolved.dispensed_at, fixture.ledger.clock.now());
}

TEST(prescription_service, resolve_pending_releases_unconfirmed_reservation) {
  auto fixture = service_fixture{"rxseal_service_resolve_release"};
  fixture.issue("RXP022");
  fixture.tamper("RXP022", [](offchain_record_t& record) {
    record.status = offchain_status_t::pending_dispense;
  });

  auto result = fixture.service->resolve_pending("RXP022");
  ASSERT_TRUE(std::holds_alternative<offchain_record_t>(result));
  EXPECT_EQ(std::get<offchain_record_t>(result).status,
            offchain_status_t::active);
  EXPECT_EQ(std::get<offchain_record_t>(result).usage_count, 0u);

  auto again = fixture.service->resolve_pending("RXP022");
  ASSERT_TRUE(std::holds_alternative<service_error>(again));
  EXPECT_EQ(error_of(again).http_status, 409);
}

TEST(prescription_service, unknown_and_malformed_records) {
  auto fixture = service_fixture{"rxseal_service_unknown"};
  auto missing = fixture.service->verify("RXNONE");
  ASSERT_TRUE(std::holds_alternative<service_error>(missing));
  EXPECT_EQ(error_of(missing).http_status, 404);

  fixture.issue("RXP011");
  fixture.tamper("RXP011", [](offchain_record_t& record) {
    record.patient_name.clear();
  });
  auto malformed = fixture.service->verify("RXP011");
  ASSERT_TRUE(std::holds_alternative<service_error>(malformed));
  EXPECT_EQ(error_of(malformed).http_status, 422);
  EXPECT_EQ(fixture.count_events(security_event_type_t::snapshot_malformed),
            1u);
}

TEST(prescription_service, reconcile_reports_each_record) {
  auto fixture = service_fixture{"rxseal_service_reconcile"};
  fixture.issue("RXP012");
  fixture.issue("RXP013");
  fixture.tamper("RXP013", [](offchain_record_t& record) {
    record.patient_age = "24";
  });
  auto error = std::string{};
  auto orphan = fixture.records->find("RXP012").value();
  orphan.short_code = "RXP014";
  ASSERT_TRUE(fixture.records->insert(orphan, error)) << error;

  auto report = fixture.service->reconcile();
  EXPECT_EQ(report.matched, 1u);
  EXPECT_EQ(report.mismatched, 1u);
  EXPECT_EQ(report.not_on_ledger, 1u);
  EXPECT_EQ(report.unreachable, 0u);
  ASSERT_EQ(report.entries.size(), 3u);
  EXPECT_EQ(report.entries[0].state,
            rxseal::service::reconciliation_state::matched);
  EXPECT_EQ(report.entries[1].state,
            rxseal::service::reconciliation_state::mismatched);
  EXPECT_FALSE(report.entries[1].integrity.patient_match);
  EXPECT_TRUE(report.entries[1].integrity.medication_match);
  EXPECT_EQ(report.entries[2].state,
            rxseal::service::reconciliation_state::not_on_ledger);

  EXPECT_EQ(fixture.records->find("RXP012")->hash_verified, true);
  EXPECT_EQ(fixture.records->find("RXP013")->hash_verified, false);
  EXPECT_FALSE(fixture.records->find("RXP014")->hash_verified.has_value());
  EXPECT_EQ(
      fixture.count_events(security_event_type_t::reconciliation_mismatch), 2u);
}

TEST(prescription_service, reconcile_with_ledger_down) {
  auto fixture = service_fixture{"rxseal_service_reconcile_down"};
  fixture.issue("RXP015");
  fixture.client.fail_ping = true;
  auto queries = fixture.client.query_calls;

  auto report = fixture.service->reconcile();
  EXPECT_EQ(report.unreachable, 1u);
  EXPECT_EQ(report.matched, 0u);
  EXPECT_EQ(fixture.client.query_calls, queries);
  EXPECT_FALSE(fixture.records->find("RXP015")->hash_verified.has_value());
}

TEST(prescription_service, sweep_expired_moves_live_records) {
  auto fixture = service_fixture{"rxseal_service_sweep"};
  fixture.issue("RXP016");
  fixture.issue("RXP017", 2);
  fixture.issue("RXP018");
  ASSERT_TRUE(std::holds_alternative<rxseal::service::mutation_result>(
      fixture.service->dispense("RXP017", fixture.ledger.pharmacy_key)));
  ASSERT_TRUE(std::holds_alternative<rxseal::service::mutation_result>(
      fixture.service->dispense("RXP018", fixture.ledger.pharmacy_key)));

  EXPECT_EQ(fixture.service->sweep_expired(kStartTime + 60), 0u);
  EXPECT_EQ(fixture.service->sweep_expired(kStartTime + kOneDay), 2u);
  EXPECT_EQ(fixture.records->find("RXP016")->status,
            offchain_status_t::expired);
  EXPECT_EQ(fixture.records->find("RXP017")->status,
            offchain_status_t::expired);
  EXPECT_EQ(fixture.records->find("RXP018")->status, offchain_status_t::used);
  EXPECT_EQ(fixture.service->sweep_expired(kStartTime + 2 * kOneDay), 0u);
}

TEST(prescription_service, error_code_labels) {
  EXPECT_EQ(rxseal::service::to_string(service_error_code::ledger_refused),
            "ledger_refused");
  EXPECT_EQ(rxseal::service::to_string(
                rxseal::service::reconciliation_state::not_on_ledger),
            "not_on_ledger");
}
