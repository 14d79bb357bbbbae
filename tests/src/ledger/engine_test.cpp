#include <gtest/gtest.h>
#include <rxseal/ledger/engine.hpp>
#include <rxseal/ledger/local_client.hpp>
#include <rxseal/ledger/signing.hpp>
#include <rxseal/schema/ledger_error_code.hpp>
#include <rxseal/schema/prescription_id.hpp>
#include <rxseal/schema/query_error_code.hpp>
#include <rxseal/testing/ledger_fixture.hpp>

#include <algorithm>
#include <string>
#include <thread>
#include <tuple>

using namespace rxseal::schema;
using rxseal::testing::kOneDay;
using rxseal::testing::kStartTime;
using rxseal::testing::ledger_fixture;
using rxseal::testing::make_account;
using rxseal::testing::make_snapshot;

namespace {

uint32_t code_of(const ledger_error_code code) {
  return static_cast<uint32_t>(code);
}

prescription_id_t id_of(const std::string_view code) {
  return try_encode_prescription_id(code).value_or(make_zero_hash());
}

std::string attribute_value(const ledger_event_t& event,
                            const std::string_view key) {
  auto it = std::find_if(
      std::begin(event.attributes), std::end(event.attributes),
      [&](const ledger_event_attribute_t& entry) { return entry.key == key; });
  return it == std::end(event.attributes) ? std::string{} : it->value;
}

}  // namespace

TEST(engine, owner_grants_roles_once) {
  auto fixture = ledger_fixture{"rxseal_engine_roles"};
  auto doctor = make_account(fixture.doctor_key);

  auto first =
      fixture.submit(fixture.owner_key, register_doctor_t{.account = doctor});
  ASSERT_EQ(first.code, 0u) << first.log;
  ASSERT_EQ(first.events.size(), 1u);
  EXPECT_EQ(first.events[0].type, "role_granted");
  EXPECT_EQ(attribute_value(first.events[0], "role"), "doctor");
  EXPECT_TRUE(fixture.engine->has_role(role_id_t::doctor, doctor));
  EXPECT_FALSE(fixture.engine->has_role(role_id_t::pharmacy, doctor));

  auto again =
      fixture.submit(fixture.owner_key, register_doctor_t{.account = doctor});
  EXPECT_EQ(again.code, 0u);
  EXPECT_EQ(again.info, "already registered");
  EXPECT_TRUE(again.events.empty());
}

TEST(engine, only_owner_grants_roles) {
  auto fixture = ledger_fixture{"rxseal_engine_not_owner"};
  auto receipt = fixture.submit(
      fixture.doctor_key,
      register_pharmacy_t{.account = make_account(fixture.pharmacy_key)});
  EXPECT_EQ(receipt.code, code_of(ledger_error_code::not_owner));
  EXPECT_EQ(receipt.codespace, rxseal::ledger::kLedgerCodespace);
  EXPECT_FALSE(fixture.engine->has_role(role_id_t::pharmacy,
                                        make_account(fixture.pharmacy_key)));
}

TEST(engine, single_use_prescription_is_dispensed_once) {
  auto fixture = ledger_fixture{"rxseal_engine_single_use"};
  fixture.register_roles();
  auto snapshot = make_snapshot();

  auto issued = fixture.issue("RX1001", snapshot, 1, kStartTime + kOneDay);
  ASSERT_EQ(issued.code, 0u) << issued.log;
  ASSERT_EQ(issued.events.size(), 1u);
  EXPECT_EQ(issued.events[0].type, "prescription_created");
  EXPECT_EQ(attribute_value(issued.events[0], "prescription_id"), "RX1001");

  auto record = fixture.engine->get_prescription(id_of("RX1001"));
  EXPECT_EQ(record.status, prescription_status_t::active);
  EXPECT_EQ(record.usage_count, 0u);
  EXPECT_EQ(record.max_usage, 1u);
  EXPECT_EQ(record.quantity, 31u);
  EXPECT_EQ(record.issued_at, kStartTime);
  EXPECT_EQ(record.issuer, make_account(fixture.doctor_key));
  EXPECT_EQ(record.patient_hash, snapshot.patient_hash);
  EXPECT_EQ(record.medication_hash, snapshot.medication_hash);

  auto dispensed = fixture.dispense("RX1001");
  ASSERT_EQ(dispensed.code, 0u) << dispensed.log;
  ASSERT_EQ(dispensed.events.size(), 1u);
  EXPECT_EQ(attribute_value(dispensed.events[0], "remaining_usage"), "0");
  EXPECT_EQ(attribute_value(dispensed.events[0], "status"), "USED");
  EXPECT_EQ(fixture.engine->get_prescription(id_of("RX1001")).status,
            prescription_status_t::used);

  auto second = fixture.dispense("RX1001");
  EXPECT_EQ(second.code, code_of(ledger_error_code::prescription_not_active));
  EXPECT_EQ(second.info, "USED");
}

TEST(engine, multi_use_prescription_counts_down) {
  auto fixture = ledger_fixture{"rxseal_engine_multi_use"};
  fixture.register_roles();
  ASSERT_EQ(
      fixture.issue("RX2002", make_snapshot(), 3, kStartTime + kOneDay).code,
      0u);

  ASSERT_EQ(fixture.dispense("RX2002").code, 0u);
  auto second = fixture.dispense("RX2002");
  ASSERT_EQ(second.code, 0u);
  EXPECT_EQ(attribute_value(second.events[0], "remaining_usage"), "1");
  EXPECT_EQ(attribute_value(second.events[0], "status"), "ACTIVE");

  auto record = fixture.engine->get_prescription(id_of("RX2002"));
  EXPECT_EQ(record.status, prescription_status_t::active);
  EXPECT_EQ(record.usage_count, 2u);

  ASSERT_EQ(fixture.dispense("RX2002").code, 0u);
  record = fixture.engine->get_prescription(id_of("RX2002"));
  EXPECT_EQ(record.status, prescription_status_t::used);
  EXPECT_EQ(record.usage_count, 3u);
}

TEST(engine, issue_refusals) {
  auto fixture = ledger_fixture{"rxseal_engine_issue_refusals"};
  fixture.register_roles();
  auto snapshot = make_snapshot();
  auto expiry = kStartTime + kOneDay;

  auto by_pharmacy = fixture.submit(
      fixture.pharmacy_key,
      issue_prescription_t{.id = id_of("RX3003"),
                           .patient_hash = snapshot.patient_hash,
                           .medication_hash = snapshot.medication_hash,
                           .quantity = 31,
                           .expiry_date = expiry,
                           .max_usage = 1});
  EXPECT_EQ(by_pharmacy.code, code_of(ledger_error_code::not_doctor));

  EXPECT_EQ(fixture.issue("RX3003", snapshot, 0, expiry).code,
            code_of(ledger_error_code::invalid_usage_limit));
  EXPECT_EQ(fixture.issue("RX3003", snapshot, 1, kStartTime).code,
            code_of(ledger_error_code::invalid_expiry));

  auto empty = fixture.submit(
      fixture.doctor_key,
      issue_prescription_t{.id = id_of("RX3003"),
                           .patient_hash = make_zero_hash(),
                           .medication_hash = snapshot.medication_hash,
                           .quantity = 31,
                           .expiry_date = expiry,
                           .max_usage = 1});
  EXPECT_EQ(empty.code, code_of(ledger_error_code::empty_commitment));

  ASSERT_EQ(fixture.issue("RX3003", snapshot, 1, expiry).code, 0u);
  EXPECT_EQ(fixture.issue("RX3003", snapshot, 1, expiry).code,
            code_of(ledger_error_code::prescription_exists));
}

TEST(engine, refused_calls_do_not_consume_nonces) {
  auto fixture = ledger_fixture{"rxseal_engine_nonce_refusal"};
  fixture.register_roles();
  auto doctor = make_account(fixture.doctor_key);
  EXPECT_EQ(fixture.engine->next_nonce(doctor), 1u);

  EXPECT_NE(fixture.issue("RX4004", make_snapshot(), 0, kStartTime + kOneDay)
                .code,
            0u);
  EXPECT_EQ(fixture.engine->next_nonce(doctor), 1u);

  ASSERT_EQ(
      fixture.issue("RX4004", make_snapshot(), 1, kStartTime + kOneDay).code,
      0u);
  EXPECT_EQ(fixture.engine->next_nonce(doctor), 2u);
}

TEST(engine, stale_or_future_nonce_is_rejected) {
  auto fixture = ledger_fixture{"rxseal_engine_bad_nonce"};
  auto call = rxseal::ledger::make_signed_call(
      fixture.owner_key, 5,
      register_doctor_t{.account = make_account(fixture.doctor_key)});
  ASSERT_TRUE(call.has_value());
  auto receipt = fixture.engine->submit(*call);
  EXPECT_EQ(receipt.code, code_of(ledger_error_code::invalid_nonce));
  EXPECT_EQ(receipt.info, "expected nonce 1");

  fixture.register_roles();
  auto replay = rxseal::ledger::make_signed_call(
      fixture.owner_key, 1,
      register_doctor_t{.account = make_account(fixture.doctor_key)});
  ASSERT_TRUE(replay.has_value());
  EXPECT_EQ(fixture.engine->submit(*replay).code,
            code_of(ledger_error_code::invalid_nonce));
}

TEST(engine, tampered_signature_is_rejected) {
  auto fixture = ledger_fixture{"rxseal_engine_signature"};
  auto call = rxseal::ledger::make_signed_call(
      fixture.owner_key, 1,
      register_doctor_t{.account = make_account(fixture.doctor_key)});
  ASSERT_TRUE(call.has_value());
  call->signature[0] ^= 0x01;
  EXPECT_EQ(fixture.engine->submit(*call).code,
            code_of(ledger_error_code::invalid_signature));

  auto foreign = *call;
  foreign.signer = fixture.pharmacy_key.public_key();
  EXPECT_EQ(fixture.engine->submit(foreign).code,
            code_of(ledger_error_code::invalid_signature));
}

TEST(engine, undecodable_call_is_rejected) {
  auto fixture = ledger_fixture{"rxseal_engine_undecodable"};
  auto garbage = bytes_t{0x01, 0x00, 0x05};
  auto receipt = fixture.engine->submit(bytes_view_t{garbage});
  EXPECT_EQ(receipt.code, code_of(ledger_error_code::invalid_call));
  EXPECT_EQ(fixture.engine->height(), 0u);
}

TEST(engine, dispense_after_expiry_commits_expired_status) {
  auto fixture = ledger_fixture{"rxseal_engine_expiry"};
  fixture.register_roles();
  ASSERT_EQ(
      fixture.issue("RX5005", make_snapshot(), 2, kStartTime + kOneDay).code,
      0u);
  auto pharmacy = make_account(fixture.pharmacy_key);
  auto nonce_before = fixture.engine->next_nonce(pharmacy);

  fixture.clock.advance(2 * kOneDay);
  auto receipt = fixture.dispense("RX5005");
  EXPECT_EQ(receipt.code, code_of(ledger_error_code::prescription_expired));
  ASSERT_EQ(receipt.events.size(), 1u);
  EXPECT_EQ(receipt.events[0].type, "prescription_expired");
  EXPECT_EQ(fixture.engine->next_nonce(pharmacy), nonce_before + 1);

  auto record = fixture.engine->get_prescription(id_of("RX5005"));
  EXPECT_EQ(record.status, prescription_status_t::expired);
  EXPECT_EQ(record.usage_count, 0u);

  auto again = fixture.dispense("RX5005");
  EXPECT_EQ(again.code, code_of(ledger_error_code::prescription_not_active));
  EXPECT_EQ(again.info, "EXPIRED");
}

TEST(engine, expiry_boundary_is_exclusive) {
  auto fixture = ledger_fixture{"rxseal_engine_expiry_boundary"};
  fixture.register_roles();
  ASSERT_EQ(
      fixture.issue("RX5006", make_snapshot(), 1, kStartTime + kOneDay).code,
      0u);
  fixture.clock.set(kStartTime + kOneDay);
  EXPECT_EQ(fixture.dispense("RX5006").code,
            code_of(ledger_error_code::prescription_expired));
}

TEST(engine, unknown_prescription_cannot_be_dispensed) {
  auto fixture = ledger_fixture{"rxseal_engine_unknown"};
  fixture.register_roles();
  auto receipt = fixture.dispense("NOPE01");
  EXPECT_EQ(receipt.code, code_of(ledger_error_code::prescription_not_active));
  EXPECT_EQ(receipt.info, "unknown prescription");
  EXPECT_FALSE(exists(fixture.engine->get_prescription(id_of("NOPE01"))));
}

TEST(engine, concurrent_dispense_of_single_use_prescription) {
  auto fixture = ledger_fixture{"rxseal_engine_concurrent"};
  fixture.register_roles();
  auto second_pharmacy = rxseal::testing::make_key(4);
  ASSERT_EQ(fixture
                .submit(fixture.owner_key,
                        register_pharmacy_t{
                            .account = make_account(second_pharmacy)})
                .code,
            0u);
  ASSERT_EQ(
      fixture.issue("RX6006", make_snapshot(), 1, kStartTime + kOneDay).code,
      0u);

  auto first_receipt = ledger_receipt_t{};
  auto second_receipt = ledger_receipt_t{};
  auto payload = dispense_prescription_t{.id = id_of("RX6006")};
  {
    auto first = std::jthread{[&] {
      first_receipt = fixture.submit(fixture.pharmacy_key, payload);
    }};
    auto second = std::jthread{[&] {
      second_receipt = fixture.submit(second_pharmacy, payload);
    }};
  }

  auto successes = (first_receipt.code == 0 ? 1 : 0) +
                   (second_receipt.code == 0 ? 1 : 0);
  EXPECT_EQ(successes, 1);
  auto refused = first_receipt.code == 0 ? second_receipt : first_receipt;
  EXPECT_EQ(refused.code, code_of(ledger_error_code::prescription_not_active));
  EXPECT_EQ(fixture.engine->get_prescription(id_of("RX6006")).usage_count, 1u);
}

TEST(engine, patient_commitment_is_set_once_by_issuer) {
  auto fixture = ledger_fixture{"rxseal_engine_commitment"};
  fixture.register_roles();
  ASSERT_EQ(
      fixture.issue("RX7007", make_snapshot(), 1, kStartTime + kOneDay).code,
      0u);
  auto commitment = rxseal::testing::make_hash(77);

  auto by_pharmacy = fixture.submit(
      fixture.pharmacy_key,
      set_patient_commitment_t{.id = id_of("RX7007"), .commitment = commitment});
  EXPECT_EQ(by_pharmacy.code, code_of(ledger_error_code::not_issuer));
  EXPECT_FALSE(
      fixture.engine->verify_patient_ownership(id_of("RX7007"), commitment));

  auto set = fixture.submit(
      fixture.doctor_key,
      set_patient_commitment_t{.id = id_of("RX7007"), .commitment = commitment});
  ASSERT_EQ(set.code, 0u) << set.log;
  EXPECT_TRUE(
      fixture.engine->verify_patient_ownership(id_of("RX7007"), commitment));
  EXPECT_FALSE(fixture.engine->verify_patient_ownership(
      id_of("RX7007"), rxseal::testing::make_hash(78)));

  auto reset = fixture.submit(
      fixture.doctor_key,
      set_patient_commitment_t{.id = id_of("RX7007"),
                               .commitment = rxseal::testing::make_hash(78)});
  EXPECT_EQ(reset.code, code_of(ledger_error_code::commitment_already_set));
}

TEST(engine, query_routes) {
  auto fixture = ledger_fixture{"rxseal_engine_queries"};
  fixture.register_roles();
  auto snapshot = make_snapshot();
  ASSERT_EQ(fixture.issue("RX8008", snapshot, 1, kStartTime + kOneDay).code,
            0u);
  auto encoder = rxseal::schema::encoding::scale_encoder_t{};

  auto hash_args = encoder.encode(std::tuple{
      id_of("RX8008"), snapshot.patient_hash, rxseal::testing::make_hash(9)});
  auto hash_result = fixture.engine->query("/prescription/verify_hash",
                                           bytes_view_t{hash_args});
  ASSERT_EQ(hash_result.code, 0u);
  auto matches = encoder.decode<std::tuple<bool, bool>>(
      bytes_view_t{hash_result.value});
  EXPECT_TRUE(std::get<0>(matches));
  EXPECT_FALSE(std::get<1>(matches));

  auto role_args = encoder.encode(
      std::tuple{role_id_t::pharmacy, make_account(fixture.pharmacy_key)});
  auto role_result =
      fixture.engine->query("/role", bytes_view_t{role_args});
  ASSERT_EQ(role_result.code, 0u);
  EXPECT_TRUE(encoder.decode<bool>(bytes_view_t{role_result.value}));

  auto info = fixture.engine->query("/engine/info", {});
  ASSERT_EQ(info.code, 0u);
  auto [height, owner, events] =
      encoder.decode<std::tuple<uint64_t, account_id_t, uint64_t>>(
          bytes_view_t{info.value});
  EXPECT_EQ(height, 3u);
  EXPECT_EQ(owner, make_account(fixture.owner_key));
  EXPECT_EQ(events, 3u);

  auto malformed = bytes_t{0x01};
  EXPECT_EQ(
      fixture.engine->query("/prescription", bytes_view_t{malformed}).code,
      static_cast<uint32_t>(query_error_code::invalid_key));
  auto unsupported = fixture.engine->query("/policy", {});
  EXPECT_EQ(unsupported.code,
            static_cast<uint32_t>(query_error_code::unsupported_path));
  EXPECT_EQ(unsupported.codespace, rxseal::ledger::kQueryCodespace);
}

TEST(engine, event_log_is_dense_and_ordered) {
  auto fixture = ledger_fixture{"rxseal_engine_events"};
  fixture.register_roles();
  ASSERT_EQ(
      fixture.issue("RX9009", make_snapshot(), 1, kStartTime + kOneDay).code,
      0u);
  ASSERT_EQ(fixture.dispense("RX9009").code, 0u);

  auto events = fixture.engine->events(0, 100);
  ASSERT_EQ(events.size(), 4u);
  for (std::size_t i = 0; i < events.size(); ++i) {
    EXPECT_EQ(events[i].event_id, i + 1);
    EXPECT_EQ(events[i].height, i + 1);
    EXPECT_EQ(events[i].recorded_at, kStartTime);
  }
  EXPECT_EQ(events[2].event.type, "prescription_created");
  EXPECT_EQ(events[3].event.type, "prescription_dispensed");

  auto tail = fixture.engine->events(3, 3);
  ASSERT_EQ(tail.size(), 1u);
  EXPECT_EQ(tail[0].event_id, 3u);
}

TEST(engine, state_survives_reopen) {
  auto fixture = ledger_fixture{"rxseal_engine_reopen"};
  fixture.register_roles();
  ASSERT_EQ(
      fixture.issue("RXA00A", make_snapshot(), 2, kStartTime + kOneDay).code,
      0u);
  ASSERT_EQ(fixture.dispense("RXA00A").code, 0u);
  auto height = fixture.engine->height();

  fixture.client.reset();
  fixture.engine.reset();
  fixture.storage.reset();
  fixture.storage = std::make_unique<rxseal::storage::rocksdb_storage_t>(
      rxseal::storage::make_storage<rxseal::storage::rocksdb_storage_tag>(
          fixture.path));
  fixture.engine = std::make_unique<rxseal::ledger::engine>(
      fixture.encoder, *fixture.storage, make_zero_hash(),
      fixture.clock.function());
  fixture.client =
      std::make_unique<rxseal::ledger::local_client>(*fixture.engine);

  EXPECT_EQ(fixture.engine->height(), height);
  EXPECT_EQ(fixture.engine->owner(), make_account(fixture.owner_key));
  EXPECT_EQ(fixture.engine->get_prescription(id_of("RXA00A")).usage_count,
            1u);
  EXPECT_EQ(fixture.engine->next_nonce(make_account(fixture.pharmacy_key)),
            2u);

  auto receipt = fixture.dispense("RXA00A");
  EXPECT_EQ(receipt.code, 0u) << receipt.log;
  EXPECT_EQ(fixture.engine->events(1, 100).size(), 5u);
}
