#include <gtest/gtest.h>
#include <veritas/certificate/canonical_encoder.hpp>
#include <veritas/certificate/hash_engine.hpp>
#include <veritas/crypto/hmac.hpp>
#include <veritas/testing/common.hpp>

#include <string>

using namespace veritas::certificate;
using namespace veritas::schema;
using veritas::testing::make_fields;
using veritas::testing::make_signing_key;

TEST(hash_engine, issue_produces_verifiable_attestation) {
  auto engine = hash_engine{make_signing_key(1)};
  auto error = std::string{};
  auto issued = engine.issue(make_fields(), error);
  ASSERT_TRUE(issued.has_value()) << error;

  EXPECT_EQ(issued->salt.size(), kSaltSize);
  EXPECT_EQ(issued->signer, engine.public_key());
  EXPECT_TRUE(hash_engine::verify_signature(issued->fingerprint,
                                            issued->signature,
                                            issued->signer));

  auto recomputed = hash_engine::recompute(make_fields(), issued->salt, error);
  ASSERT_TRUE(recomputed.has_value()) << error;
  EXPECT_TRUE(hash_engine::same_fingerprint(*recomputed, issued->fingerprint));
}

TEST(hash_engine, fingerprint_is_hmac_of_canonical_bytes) {
  auto salt = bytes_t(32, 0x11);
  auto error = std::string{};
  auto canonical = canonicalize(make_fields(), error);
  ASSERT_TRUE(canonical.has_value()) << error;
  auto fingerprint = hash_engine::recompute(make_fields(), salt, error);
  ASSERT_TRUE(fingerprint.has_value()) << error;
  EXPECT_EQ(*fingerprint, veritas::crypto::hmac_sha256(salt, *canonical));
}

TEST(hash_engine, same_fields_issued_twice_get_different_fingerprints) {
  auto engine = hash_engine{make_signing_key(1)};
  auto error = std::string{};
  auto first = engine.issue(make_fields(), error);
  auto second = engine.issue(make_fields(), error);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(first->salt, second->salt);
  EXPECT_NE(first->fingerprint, second->fingerprint);
}

TEST(hash_engine, salt_change_changes_fingerprint) {
  auto error = std::string{};
  auto lhs = hash_engine::recompute(make_fields(), bytes_t(32, 0x01), error);
  auto rhs = hash_engine::recompute(make_fields(), bytes_t(32, 0x02), error);
  ASSERT_TRUE(lhs.has_value());
  ASSERT_TRUE(rhs.has_value());
  EXPECT_FALSE(hash_engine::same_fingerprint(*lhs, *rhs));
}

TEST(hash_engine, tampered_grade_does_not_match) {
  auto salt = bytes_t(32, 0x07);
  auto error = std::string{};
  auto original = hash_engine::recompute(make_fields(), salt, error);
  auto tampered_fields = make_fields();
  tampered_fields.grade = "A+";
  auto tampered = hash_engine::recompute(tampered_fields, salt, error);
  ASSERT_TRUE(original.has_value());
  ASSERT_TRUE(tampered.has_value());
  EXPECT_FALSE(hash_engine::same_fingerprint(*original, *tampered));
}

TEST(hash_engine, recompute_rejects_short_salt) {
  auto error = std::string{};
  auto result = hash_engine::recompute(
      make_fields(), bytes_t(kMinimumSaltSize - 1, 0x01), error);
  EXPECT_FALSE(result.has_value());
  EXPECT_FALSE(error.empty());

  error.clear();
  EXPECT_TRUE(hash_engine::recompute(make_fields(),
                                     bytes_t(kMinimumSaltSize, 0x01), error)
                  .has_value());
}

TEST(hash_engine, recompute_reports_field_errors_before_salt_errors) {
  auto fields = make_fields();
  fields.grade = "  ";
  auto error = std::string{};
  EXPECT_FALSE(hash_engine::recompute(fields, bytes_t(4, 0x01), error)
                   .has_value());
  EXPECT_EQ(error, "grade is required");
}

TEST(hash_engine, issue_rejects_invalid_fields) {
  auto engine = hash_engine{make_signing_key(1)};
  auto fields = make_fields();
  fields.issue_date = "2023-02-30";
  auto error = std::string{};
  EXPECT_FALSE(engine.issue(fields, error).has_value());
  EXPECT_FALSE(error.empty());
}

TEST(hash_engine, signature_from_other_key_does_not_verify) {
  auto engine = hash_engine{make_signing_key(1)};
  auto other = make_signing_key(2);
  auto error = std::string{};
  auto issued = engine.issue(make_fields(), error);
  ASSERT_TRUE(issued.has_value());
  EXPECT_FALSE(hash_engine::verify_signature(
      issued->fingerprint, issued->signature, other.public_key()));
}
