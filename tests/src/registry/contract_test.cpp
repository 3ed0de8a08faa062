#include <gtest/gtest.h>
#include <veritas/registry/contract.hpp>
#include <veritas/testing/common.hpp>

#include <set>

using namespace veritas::schema;
using veritas::testing::make_hash;

namespace {

struct memory_state final {
  std::set<fingerprint_t> verified;

  bool is_verified(const fingerprint_t& fingerprint) const {
    return verified.contains(fingerprint);
  }
  void mark_verified(const fingerprint_t& fingerprint) {
    verified.insert(fingerprint);
  }
};

}  // namespace

TEST(registry_contract, owner_adds_hash_and_emits_event) {
  auto state = memory_state{};
  auto owner = make_hash(1);
  auto registry = veritas::registry::contract<memory_state>{state, owner};

  auto result = registry.add_certificate_hash(
      owner, add_certificate_hash_t{.fingerprint = make_hash(50)});
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(result.gas_used, veritas::registry::kAddCertificateHashGas);
  EXPECT_TRUE(registry.is_verified(make_hash(50)));

  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, kHashAddedEventType);
  ASSERT_EQ(result.events[0].attributes.size(), 1u);
  EXPECT_EQ(result.events[0].attributes[0].key, "fingerprint");
  EXPECT_EQ(result.events[0].attributes[0].value, to_hex(make_hash(50)));
  EXPECT_TRUE(result.events[0].attributes[0].index);
}

TEST(registry_contract, unknown_fingerprint_is_not_verified) {
  auto state = memory_state{};
  auto registry =
      veritas::registry::contract<memory_state>{state, make_hash(1)};
  EXPECT_FALSE(registry.is_verified(make_hash(99)));
  EXPECT_FALSE(registry.is_verified(make_zero_hash()));
}

TEST(registry_contract, non_owner_reverts_without_state_change) {
  auto state = memory_state{};
  auto registry =
      veritas::registry::contract<memory_state>{state, make_hash(1)};

  auto result = registry.add_certificate_hash(
      make_hash(2), add_certificate_hash_t{.fingerprint = make_hash(50)});
  EXPECT_EQ(result.code, to_code(transaction_error_code::not_owner));
  EXPECT_TRUE(result.events.empty());
  EXPECT_FALSE(registry.is_verified(make_hash(50)));
}

TEST(registry_contract, second_add_reverts_as_duplicate) {
  auto state = memory_state{};
  auto owner = make_hash(1);
  auto registry = veritas::registry::contract<memory_state>{state, owner};
  auto call = add_certificate_hash_t{.fingerprint = make_hash(50)};

  ASSERT_EQ(registry.add_certificate_hash(owner, call).code, 0u);
  auto again = registry.add_certificate_hash(owner, call);
  EXPECT_EQ(again.code, to_code(transaction_error_code::duplicate_entry));
  EXPECT_EQ(again.log, "certificate hash already exists");
  EXPECT_TRUE(again.events.empty());
  EXPECT_TRUE(registry.is_verified(make_hash(50)));
}

TEST(registry_contract, zero_fingerprint_is_an_ordinary_key) {
  auto state = memory_state{};
  auto owner = make_hash(1);
  auto registry = veritas::registry::contract<memory_state>{state, owner};
  auto result = registry.add_certificate_hash(
      owner, add_certificate_hash_t{.fingerprint = make_zero_hash()});
  EXPECT_EQ(result.code, 0u);
  EXPECT_TRUE(registry.is_verified(make_zero_hash()));
}
