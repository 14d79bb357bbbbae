#include <gtest/gtest.h>
#include <rxseal/validation/chain_error.hpp>

using rxseal::schema::chain_error_code;
using rxseal::validation::chain_validation_error;

TEST(chain_error, only_unreachable_maps_to_503) {
  EXPECT_EQ(rxseal::validation::http_status(chain_error_code::chain_unreachable),
            503);
  for (auto code :
       {chain_error_code::not_found_on_chain, chain_error_code::status_mismatch,
        chain_error_code::usage_exhausted, chain_error_code::expired_on_chain,
        chain_error_code::hash_mismatch}) {
    EXPECT_EQ(rxseal::validation::http_status(code), 403);
    EXPECT_FALSE(rxseal::validation::is_retryable(code));
  }
  EXPECT_TRUE(
      rxseal::validation::is_retryable(chain_error_code::chain_unreachable));
}

TEST(chain_error, status_mismatch_reason_follows_actual_status) {
  auto error = chain_validation_error{
      .code = chain_error_code::status_mismatch,
      .message = "Ledger status is not ACTIVE",
      .context = {{"expected", "ACTIVE"}, {"actual", "USED"}}};
  EXPECT_EQ(rxseal::validation::user_reason(error), "already dispensed");

  error.context.back().second = "EXPIRED";
  EXPECT_EQ(rxseal::validation::user_reason(error), "expired");

  error.context.back().second = "CREATED";
  EXPECT_EQ(rxseal::validation::user_reason(error), "prescription not active");

  error.context.clear();
  EXPECT_EQ(rxseal::validation::user_reason(error), "prescription not active");
}

TEST(chain_error, find_returns_first_match) {
  auto error = chain_validation_error{
      .code = chain_error_code::hash_mismatch,
      .message = {},
      .context = {{"patientMatch", "false"}, {"medMatch", "true"}}};
  EXPECT_EQ(error.find("medMatch"), "true");
  EXPECT_FALSE(error.find("rpcUrl").has_value());
}

TEST(chain_error, format_context_is_space_separated) {
  EXPECT_EQ(rxseal::validation::format_context(
                {{"prescriptionId", "RX1"}, {"usageCount", "1"}}),
            "prescriptionId=RX1 usageCount=1");
  EXPECT_EQ(rxseal::validation::format_context({}), "");
}
