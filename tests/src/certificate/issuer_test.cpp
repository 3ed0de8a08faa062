#include <gtest/gtest.h>
#include <veritas/certificate/hash_engine.hpp>
#include <veritas/certificate/issuer.hpp>
#include <veritas/certificate/orchestrator.hpp>
#include <veritas/testing/fake_chain_client.hpp>
#include <veritas/testing/record_store_fixture.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace veritas::schema;
using veritas::certificate::hash_engine;
using veritas::certificate::issuer;
using veritas::certificate::orchestrator;
using veritas::testing::fake_chain_client;
using veritas::testing::make_fields;
using veritas::testing::record_store_fixture;

TEST(certificate_issuer, issue_persists_and_registers) {
  auto fixture = record_store_fixture{"veritas_issuer_ok"};
  auto engine = hash_engine{veritas::testing::make_signing_key(1)};
  auto chain = fake_chain_client{};
  auto service = issuer{engine, fixture.records(), chain};

  auto error = std::string{};
  auto result = service.issue(make_fields(), error);
  ASSERT_TRUE(result.has_value()) << error;
  EXPECT_TRUE(veritas::certificate::registered(*result));
  EXPECT_FALSE(result->chain_error.has_value());
  ASSERT_TRUE(result->transaction_id.has_value());

  EXPECT_EQ(result->record.fields.student_name, "asha verma");
  EXPECT_EQ(result->record.signer, engine.public_key());
  EXPECT_GT(result->record.issued_at, 0u);
  EXPECT_TRUE(chain.registered.contains(result->record.fingerprint));
  EXPECT_EQ(fixture.records().transaction_id(result->record.fingerprint),
            result->transaction_id);
}

TEST(certificate_issuer, chain_failure_keeps_the_record) {
  auto fixture = record_store_fixture{"veritas_issuer_transient"};
  auto engine = hash_engine{veritas::testing::make_signing_key(1)};
  auto chain = fake_chain_client{};
  chain.failure = chain_error_code::network_unavailable;
  auto service = issuer{engine, fixture.records(), chain};

  auto error = std::string{};
  auto result = service.issue(make_fields(), error);
  ASSERT_TRUE(result.has_value()) << error;
  EXPECT_FALSE(veritas::certificate::registered(*result));
  EXPECT_EQ(result->chain_error, chain_error_code::network_unavailable);
  EXPECT_FALSE(result->transaction_id.has_value());

  auto stored =
      fixture.records().find_by_fingerprint(result->record.fingerprint);
  ASSERT_TRUE(stored.has_value());
  EXPECT_FALSE(
      fixture.records().transaction_id(result->record.fingerprint).has_value());

  chain.failure.reset();
  auto retried =
      service.retry_registration(result->record.fingerprint, error);
  ASSERT_TRUE(retried.has_value()) << error;
  EXPECT_TRUE(veritas::certificate::registered(*retried));
  EXPECT_TRUE(chain.registered.contains(result->record.fingerprint));
}

TEST(certificate_issuer, insufficient_funds_is_reported_not_retried) {
  auto fixture = record_store_fixture{"veritas_issuer_funds"};
  auto engine = hash_engine{veritas::testing::make_signing_key(1)};
  auto chain = fake_chain_client{};
  chain.failure = chain_error_code::insufficient_funds;
  auto service = issuer{engine, fixture.records(), chain};

  auto error = std::string{};
  auto result = service.issue(make_fields(), error);
  ASSERT_TRUE(result.has_value()) << error;
  EXPECT_EQ(result->chain_error, chain_error_code::insufficient_funds);
  EXPECT_EQ(chain.register_calls, 1u);
  EXPECT_TRUE(fixture.records()
                  .find_by_fingerprint(result->record.fingerprint)
                  .has_value());
}

TEST(certificate_issuer, late_landing_registration_is_duplicate_but_done) {
  auto fixture = record_store_fixture{"veritas_issuer_duplicate"};
  auto engine = hash_engine{veritas::testing::make_signing_key(1)};
  auto chain = fake_chain_client{};
  chain.failure = chain_error_code::timeout;
  auto service = issuer{engine, fixture.records(), chain};

  auto error = std::string{};
  auto result = service.issue(make_fields(), error);
  ASSERT_TRUE(result.has_value()) << error;
  EXPECT_EQ(result->chain_error, chain_error_code::timeout);

  // The timed-out transaction was mined after all.
  chain.failure.reset();
  chain.registered.insert(result->record.fingerprint);

  auto retried =
      service.retry_registration(result->record.fingerprint, error);
  ASSERT_TRUE(retried.has_value()) << error;
  EXPECT_EQ(retried->chain_error, chain_error_code::duplicate_entry);
  EXPECT_TRUE(veritas::certificate::registered(*retried));
}

TEST(certificate_issuer, retry_skips_already_registered_records) {
  auto fixture = record_store_fixture{"veritas_issuer_retry_skip"};
  auto engine = hash_engine{veritas::testing::make_signing_key(1)};
  auto chain = fake_chain_client{};
  auto service = issuer{engine, fixture.records(), chain};

  auto error = std::string{};
  auto result = service.issue(make_fields(), error);
  ASSERT_TRUE(result.has_value()) << error;
  ASSERT_EQ(chain.register_calls, 1u);

  auto retried =
      service.retry_registration(result->record.fingerprint, error);
  ASSERT_TRUE(retried.has_value());
  EXPECT_EQ(retried->transaction_id, result->transaction_id);
  EXPECT_EQ(chain.register_calls, 1u);
}

TEST(certificate_issuer, retry_of_unknown_fingerprint_fails) {
  auto fixture = record_store_fixture{"veritas_issuer_retry_unknown"};
  auto engine = hash_engine{veritas::testing::make_signing_key(1)};
  auto chain = fake_chain_client{};
  auto service = issuer{engine, fixture.records(), chain};

  auto error = std::string{};
  EXPECT_FALSE(service.retry_registration(veritas::testing::make_hash(5),
                                          error)
                   .has_value());
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(chain.register_calls, 0u);
}

TEST(certificate_issuer, invalid_fields_touch_nothing) {
  auto fixture = record_store_fixture{"veritas_issuer_invalid"};
  auto engine = hash_engine{veritas::testing::make_signing_key(1)};
  auto chain = fake_chain_client{};
  auto service = issuer{engine, fixture.records(), chain};

  auto fields = make_fields();
  fields.student_name = "";
  auto error = std::string{};
  EXPECT_FALSE(service.issue(fields, error).has_value());
  EXPECT_EQ(error, "student_name is required");
  EXPECT_EQ(chain.register_calls, 0u);
}

TEST(certificate_issuer, same_roll_number_can_hold_several_certificates) {
  auto fixture = record_store_fixture{"veritas_issuer_same_roll"};
  auto engine = hash_engine{veritas::testing::make_signing_key(1)};
  auto chain = fake_chain_client{};
  auto service = issuer{engine, fixture.records(), chain};

  auto bachelor = make_fields();
  auto master = make_fields();
  master.course_name = "M.Tech Computer Science";
  master.issue_date = "2026-06-20";

  auto error = std::string{};
  auto first = service.issue(bachelor, error);
  ASSERT_TRUE(first.has_value()) << error;
  auto second = service.issue(master, error);
  ASSERT_TRUE(second.has_value()) << error;
  EXPECT_NE(first->record.fingerprint, second->record.fingerprint);
  EXPECT_EQ(chain.register_calls, 2u);

  auto verifier = orchestrator{fixture.records(), chain, engine.public_key()};
  auto issued_pairs = std::vector{std::pair{bachelor, first.value()},
                                  std::pair{master, second.value()}};
  for (const auto& [fields, issued] : issued_pairs) {
    auto result = verifier.verify(fields, error);
    ASSERT_TRUE(result.has_value()) << error;
    EXPECT_EQ(result->verdict, verification_verdict_t::verified_on_chain);
    ASSERT_TRUE(result->record.has_value());
    EXPECT_EQ(result->record->fingerprint, issued.record.fingerprint);
    EXPECT_EQ(result->transaction_id, issued.transaction_id);
  }

  auto tampered = master;
  tampered.grade = "A+";
  chain.verify_calls = 0;
  auto result = verifier.verify(tampered, error);
  ASSERT_TRUE(result.has_value()) << error;
  EXPECT_EQ(result->verdict, verification_verdict_t::hash_mismatch);
  EXPECT_EQ(chain.verify_calls, 0u);
}
