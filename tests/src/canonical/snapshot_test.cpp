#include <gtest/gtest.h>
#include <rxseal/blake3/hash.hpp>
#include <rxseal/canonical/snapshot.hpp>
#include <rxseal/testing/common.hpp>

#include <algorithm>
#include <string>
#include <vector>

using rxseal::schema::medicine_entry_t;

namespace {

rxseal::canonical::snapshot build(const std::string& name,
                                  const std::string& age,
                                  const std::vector<medicine_entry_t>& meds) {
  auto error = std::string{};
  auto snapshot = rxseal::canonical::build_snapshot(name, age, meds, error);
  EXPECT_TRUE(snapshot.has_value()) << error;
  return snapshot.value_or(rxseal::canonical::snapshot{});
}

std::optional<rxseal::canonical::snapshot> try_build(
    const std::vector<medicine_entry_t>& meds,
    std::string& error) {
  return rxseal::canonical::build_snapshot("Jane Doe", "42", meds, error);
}

}  // namespace

TEST(canonical_snapshot, serializes_sorted_compact_json) {
  auto snapshot = build("Jane Doe", "42", rxseal::testing::make_medicines());
  EXPECT_EQ(snapshot.protocol_version, rxseal::canonical::kProtocolVersion);
  EXPECT_EQ(snapshot.serialized,
            R"([{"name":"Amoxicillin","dosage":"250mg","quantity":21},)"
            R"({"name":"Paracetamol","dosage":"500mg","quantity":10}])");
  EXPECT_EQ(snapshot.medication_hash,
            rxseal::blake3::hash(std::string_view{snapshot.serialized}));
  EXPECT_EQ(rxseal::canonical::total_quantity(snapshot), 31u);
}

TEST(canonical_snapshot, patient_hash_covers_trimmed_name_and_age) {
  auto snapshot =
      build("  Jane Doe\t", " 42 ", rxseal::testing::make_medicines());
  EXPECT_EQ(snapshot.patient_hash,
            rxseal::blake3::hash(std::string_view{"Jane Doe42"}));
  EXPECT_EQ(snapshot.patient_hash,
            build("Jane Doe", "42", rxseal::testing::make_medicines())
                .patient_hash);
  EXPECT_NE(snapshot.patient_hash,
            build("Jane Doe", "43", rxseal::testing::make_medicines())
                .patient_hash);
}

TEST(canonical_snapshot, input_order_does_not_change_hashes) {
  auto medicines = rxseal::testing::make_medicines();
  auto forward = build("Jane Doe", "42", medicines);
  std::reverse(medicines.begin(), medicines.end());
  auto reversed = build("Jane Doe", "42", medicines);
  EXPECT_EQ(forward.serialized, reversed.serialized);
  EXPECT_EQ(forward.medication_hash, reversed.medication_hash);
}

TEST(canonical_snapshot, instructions_and_whitespace_are_not_committed) {
  auto medicines = rxseal::testing::make_medicines();
  auto baseline = build("Jane Doe", "42", medicines);
  medicines[0].instructions = "before bed";
  medicines[1].name = "  Amoxicillin  ";
  medicines[1].dosage = "250mg\n";
  medicines[1].quantity = " 21 ";
  EXPECT_EQ(build("Jane Doe", "42", medicines).medication_hash,
            baseline.medication_hash);

  medicines[1].dosage = "500mg";
  EXPECT_NE(build("Jane Doe", "42", medicines).medication_hash,
            baseline.medication_hash);
}

TEST(canonical_snapshot, medication_hash_covers_name) {
  auto medicines = rxseal::testing::make_medicines();
  auto baseline = build("Jane Doe", "42", medicines);
  medicines[0].name = "Paracetamol Forte";
  auto renamed = build("Jane Doe", "42", medicines);
  EXPECT_NE(renamed.medication_hash, baseline.medication_hash);
  EXPECT_EQ(renamed.patient_hash, baseline.patient_hash);
}

TEST(canonical_snapshot, medication_hash_covers_quantity) {
  auto medicines = rxseal::testing::make_medicines();
  auto baseline = build("Jane Doe", "42", medicines);
  medicines[0].quantity = "11";
  auto edited = build("Jane Doe", "42", medicines);
  EXPECT_NE(edited.medication_hash, baseline.medication_hash);
  EXPECT_EQ(edited.patient_hash, baseline.patient_hash);
}

TEST(canonical_snapshot, sort_is_bytewise_and_stable) {
  auto snapshot = build(
      "Jane Doe", "42",
      {medicine_entry_t{.name = "aspirin", .dosage = "1", .quantity = "1"},
       medicine_entry_t{.name = "Zinc", .dosage = "first", .quantity = "1"},
       medicine_entry_t{.name = "Zinc", .dosage = "second", .quantity = "1"}});
  ASSERT_EQ(snapshot.medicines.size(), 3u);
  EXPECT_EQ(snapshot.medicines[0].name, "Zinc");
  EXPECT_EQ(snapshot.medicines[0].dosage, "first");
  EXPECT_EQ(snapshot.medicines[1].dosage, "second");
  EXPECT_EQ(snapshot.medicines[2].name, "aspirin");
}

TEST(canonical_snapshot, quantity_coercion) {
  auto error = std::string{};
  EXPECT_EQ(rxseal::canonical::coerce_quantity("12", error), 12u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity(" 12 ", error), 12u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("+7", error), 7u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("2.9", error), 2u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("1e3", error), 1000u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("", error), 0u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("ten", error), 0u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("12 tablets", error), 0u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("NaN", error), 0u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("nan", error), 0u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("inf", error), 0u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("infinity", error), 0u);
  EXPECT_EQ(rxseal::canonical::coerce_quantity("9007199254740991", error),
            rxseal::canonical::kMaxCanonicalQuantity);
}

TEST(canonical_snapshot, quantity_out_of_domain_is_malformed) {
  for (auto raw : {"-1", "-2.5", "9007199254740992", "1e400"}) {
    auto error = std::string{};
    EXPECT_FALSE(rxseal::canonical::coerce_quantity(raw, error).has_value())
        << raw;
    EXPECT_FALSE(error.empty()) << raw;
  }
}

TEST(canonical_snapshot, rejects_missing_identity_and_names) {
  auto error = std::string{};
  EXPECT_FALSE(rxseal::canonical::build_snapshot(
      "   ", "42", rxseal::testing::make_medicines(), error));
  EXPECT_EQ(error, "patient name is empty");
  EXPECT_FALSE(rxseal::canonical::build_snapshot(
      "Jane Doe", "", rxseal::testing::make_medicines(), error));
  EXPECT_EQ(error, "patient age is empty");
  EXPECT_FALSE(try_build({medicine_entry_t{.name = " ", .quantity = "1"}},
                         error));
  EXPECT_NE(error.find("empty name"), std::string::npos);
}

TEST(canonical_snapshot, rejects_invalid_utf8) {
  auto error = std::string{};
  EXPECT_FALSE(try_build(
      {medicine_entry_t{.name = std::string{"Ibu\xff"}, .quantity = "1"}},
      error));
  EXPECT_NE(error.find("UTF-8"), std::string::npos);
}

TEST(canonical_snapshot, empty_medicine_list_serializes_to_empty_array) {
  auto snapshot = build("Jane Doe", "42", {});
  EXPECT_EQ(snapshot.serialized, "[]");
  EXPECT_EQ(rxseal::canonical::total_quantity(snapshot), 0u);
}
