#include <gtest/gtest.h>
#include <veritas/registry/contract.hpp>
#include <veritas/registry/engine.hpp>
#include <veritas/registry/transaction_signing.hpp>
#include <veritas/schema/transaction_error_code.hpp>
#include <veritas/testing/registry_fixture.hpp>

#include <limits>
#include <string>

using namespace veritas::schema;
using veritas::registry::kAddCertificateHashGas;
using veritas::testing::make_hash;
using veritas::testing::make_signing_key;
using veritas::testing::registry_fixture;

TEST(registry_engine, genesis_funds_owner_at_height_zero) {
  auto fixture = registry_fixture{"veritas_engine_genesis"};
  auto info = fixture.engine().info();
  EXPECT_EQ(info.last_block_height, 0u);
  EXPECT_EQ(info.last_block_state_root, make_zero_hash());
  EXPECT_EQ(info.chain_id, fixture.genesis().chain_id);
  EXPECT_EQ(info.owner, fixture.owner_key().public_key());
  EXPECT_EQ(info.gas_price, 1u);

  auto account = fixture.engine().account(fixture.owner_key().public_key());
  EXPECT_EQ(account.nonce, 0u);
  EXPECT_EQ(account.balance, veritas::testing::kTestOwnerBalance);
}

TEST(registry_engine, owner_registration_is_queued_then_committed) {
  auto fixture = registry_fixture{"veritas_engine_register"};
  auto& engine = fixture.engine();
  auto fingerprint = make_hash(40);

  auto submitted = fixture.submit(fixture.owner_key(), 0, fingerprint);
  ASSERT_EQ(submitted.code, 0u) << submitted.log;
  auto transaction_id = try_make_hash32(make_bytes_view(submitted.data));
  ASSERT_TRUE(transaction_id.has_value());

  EXPECT_EQ(engine.pending_count(), 1u);
  EXPECT_FALSE(engine.is_verified(fingerprint));
  EXPECT_EQ(engine.receipt(*transaction_id).status, receipt_status_t::pending);
  EXPECT_EQ(engine.account(fixture.owner_key().public_key()).pending_nonce,
            1u);

  auto block = engine.produce_block();
  ASSERT_TRUE(block.has_value());
  EXPECT_EQ(block->height, 1u);
  ASSERT_EQ(block->receipts.size(), 1u);
  EXPECT_EQ(block->receipts[0].result.code, 0u);

  EXPECT_TRUE(engine.is_verified(fingerprint));
  EXPECT_EQ(engine.pending_count(), 0u);
  auto query = engine.receipt(*transaction_id);
  EXPECT_EQ(query.status, receipt_status_t::confirmed);
  ASSERT_TRUE(query.receipt.has_value());
  EXPECT_EQ(query.receipt->height, 1u);
  EXPECT_EQ(query.receipt->result.gas_used, kAddCertificateHashGas);

  auto account = engine.account(fixture.owner_key().public_key());
  EXPECT_EQ(account.nonce, 1u);
  EXPECT_EQ(account.balance, veritas::testing::kTestOwnerBalance -
                                 static_cast<amount_t>(kAddCertificateHashGas));

  auto events = engine.events(1, 1);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].fingerprint, fingerprint);
  EXPECT_EQ(events[0].transaction_id, *transaction_id);
}

TEST(registry_engine, empty_queue_produces_no_block) {
  auto fixture = registry_fixture{"veritas_engine_empty"};
  EXPECT_FALSE(fixture.engine().produce_block().has_value());
  EXPECT_EQ(fixture.engine().info().last_block_height, 0u);
}

TEST(registry_engine, non_owner_is_refused) {
  auto fixture = registry_fixture{"veritas_engine_non_owner"};
  auto outsider = make_signing_key(9);
  auto result = fixture.submit(outsider, 0, make_hash(40));
  EXPECT_EQ(result.code, to_code(transaction_error_code::not_owner));
  EXPECT_EQ(result.gas_used, 0);
  EXPECT_EQ(fixture.engine().pending_count(), 0u);
  EXPECT_FALSE(fixture.engine().is_verified(make_hash(40)));
}

TEST(registry_engine, nonce_must_follow_committed_and_queued) {
  auto fixture = registry_fixture{"veritas_engine_nonce"};
  auto wrong = fixture.submit(fixture.owner_key(), 5, make_hash(40));
  EXPECT_EQ(wrong.code, to_code(transaction_error_code::invalid_nonce));
  EXPECT_EQ(wrong.info, "expected nonce 0");

  EXPECT_EQ(fixture.submit(fixture.owner_key(), 0, make_hash(40)).code, 0u);
  EXPECT_EQ(fixture.submit(fixture.owner_key(), 1, make_hash(41)).code, 0u);
  auto replay = fixture.submit(fixture.owner_key(), 1, make_hash(42));
  EXPECT_EQ(replay.code, to_code(transaction_error_code::invalid_nonce));
  EXPECT_EQ(replay.info, "expected nonce 2");

  auto block = fixture.engine().produce_block();
  ASSERT_TRUE(block.has_value());
  ASSERT_EQ(block->receipts.size(), 2u);
  EXPECT_EQ(block->receipts[0].result.code, 0u);
  EXPECT_EQ(block->receipts[1].result.code, 0u);
  EXPECT_EQ(block->receipts[1].index, 1u);
}

TEST(registry_engine, rejects_wrong_chain_id) {
  auto fixture = registry_fixture{"veritas_engine_chain_id"};
  auto tx = veritas::testing::make_signed_transaction(
      fixture.encoder(), fixture.owner_key(), 0, make_hash(40),
      veritas::registry::make_chain_id("another-chain"));
  auto result =
      fixture.engine().submit_transaction(fixture.encoder().encode(tx));
  EXPECT_EQ(result.code, to_code(transaction_error_code::invalid_chain_id));
}

TEST(registry_engine, rejects_tampered_signature) {
  auto fixture = registry_fixture{"veritas_engine_signature"};
  auto tx = veritas::testing::make_signed_transaction(
      fixture.encoder(), fixture.owner_key(), 0, make_hash(40));
  tx.payload.fingerprint = make_hash(41);
  auto result =
      fixture.engine().submit_transaction(fixture.encoder().encode(tx));
  EXPECT_EQ(result.code,
            to_code(transaction_error_code::signature_verification_failed));
}

TEST(registry_engine, rejects_unsupported_version) {
  auto fixture = registry_fixture{"veritas_engine_version"};
  auto tx = veritas::testing::make_signed_transaction(
      fixture.encoder(), fixture.owner_key(), 0, make_hash(40));
  tx.version = 2;
  auto result =
      fixture.engine().submit_transaction(fixture.encoder().encode(tx));
  EXPECT_EQ(result.code,
            to_code(transaction_error_code::unsupported_transaction_version));
}

TEST(registry_engine, rejects_empty_and_undecodable_bytes) {
  auto fixture = registry_fixture{"veritas_engine_garbage"};
  auto empty = fixture.engine().submit_transaction(bytes_view_t{});
  EXPECT_EQ(empty.code, to_code(transaction_error_code::invalid_transaction));

  auto garbage = bytes_t{0xFF, 0x00, 0x01};
  auto result = fixture.engine().submit_transaction(garbage);
  EXPECT_EQ(result.code, to_code(transaction_error_code::invalid_transaction));
}

TEST(registry_engine, committed_duplicate_is_refused_at_admission) {
  auto fixture = registry_fixture{"veritas_engine_duplicate"};
  ASSERT_EQ(fixture.submit(fixture.owner_key(), 0, make_hash(40)).code, 0u);
  ASSERT_TRUE(fixture.engine().produce_block().has_value());

  auto again = fixture.submit(fixture.owner_key(), 1, make_hash(40));
  EXPECT_EQ(again.code, to_code(transaction_error_code::duplicate_entry));
  EXPECT_EQ(fixture.engine().pending_count(), 0u);
}

TEST(registry_engine, duplicate_within_one_block_reverts_second) {
  auto fixture = registry_fixture{"veritas_engine_duplicate_block"};
  ASSERT_EQ(fixture.submit(fixture.owner_key(), 0, make_hash(40)).code, 0u);
  ASSERT_EQ(fixture.submit(fixture.owner_key(), 1, make_hash(40)).code, 0u);

  auto block = fixture.engine().produce_block();
  ASSERT_TRUE(block.has_value());
  ASSERT_EQ(block->receipts.size(), 2u);
  EXPECT_EQ(block->receipts[0].result.code, 0u);
  EXPECT_EQ(block->receipts[1].result.code,
            to_code(transaction_error_code::duplicate_entry));
  EXPECT_TRUE(block->receipts[1].result.events.empty());

  // A revert still consumes nonce and gas.
  auto account =
      fixture.engine().account(fixture.owner_key().public_key());
  EXPECT_EQ(account.nonce, 2u);
  EXPECT_EQ(account.balance,
            veritas::testing::kTestOwnerBalance -
                2 * static_cast<amount_t>(kAddCertificateHashGas));
  EXPECT_EQ(fixture.engine().events(1, 1).size(), 1u);
}

TEST(registry_engine, queued_spend_counts_against_balance) {
  auto fixture = registry_fixture{"veritas_engine_funds", 50'000};
  EXPECT_EQ(fixture.submit(fixture.owner_key(), 0, make_hash(40)).code, 0u);
  auto second = fixture.submit(fixture.owner_key(), 1, make_hash(41));
  EXPECT_EQ(second.code, to_code(transaction_error_code::insufficient_funds));
  EXPECT_EQ(fixture.engine().account(fixture.owner_key().public_key())
                .pending_spend,
            static_cast<amount_t>(kAddCertificateHashGas));
}

TEST(registry_engine, full_queue_refuses_admission) {
  auto fixture = registry_fixture{"veritas_engine_mempool",
                                  veritas::testing::kTestOwnerBalance, 1};
  EXPECT_EQ(fixture.submit(fixture.owner_key(), 0, make_hash(40)).code, 0u);
  auto result = fixture.submit(fixture.owner_key(), 1, make_hash(41));
  EXPECT_EQ(result.code, to_code(transaction_error_code::mempool_full));
}

TEST(registry_engine, unknown_receipt_is_reported_as_unknown) {
  auto fixture = registry_fixture{"veritas_engine_unknown_receipt"};
  auto query = fixture.engine().receipt(make_hash(77));
  EXPECT_EQ(query.status, receipt_status_t::unknown);
  EXPECT_FALSE(query.receipt.has_value());
}

TEST(registry_engine, events_are_filtered_by_height) {
  auto fixture = registry_fixture{"veritas_engine_events"};
  ASSERT_EQ(fixture.submit(fixture.owner_key(), 0, make_hash(40)).code, 0u);
  ASSERT_TRUE(fixture.engine().produce_block().has_value());
  ASSERT_EQ(fixture.submit(fixture.owner_key(), 1, make_hash(41)).code, 0u);
  ASSERT_TRUE(fixture.engine().produce_block().has_value());

  EXPECT_EQ(fixture.engine().events(1, 2).size(), 2u);
  auto second = fixture.engine().events(2, 2);
  ASSERT_EQ(second.size(), 1u);
  EXPECT_EQ(second[0].fingerprint, make_hash(41));
  EXPECT_TRUE(fixture.engine().events(3, 10).empty());
  EXPECT_TRUE(fixture.engine().events(2, 1).empty());

  auto first = fixture.engine().events(1, 1);
  ASSERT_EQ(first.size(), 1u);
  EXPECT_EQ(first[0].fingerprint, make_hash(40));
  EXPECT_EQ(fixture.engine()
                .events(0, std::numeric_limits<uint64_t>::max())
                .size(),
            2u);
}

TEST(registry_engine, committed_state_survives_restart) {
  auto fixture = registry_fixture{"veritas_engine_restart"};
  ASSERT_EQ(fixture.submit(fixture.owner_key(), 0, make_hash(40)).code, 0u);
  auto block = fixture.engine().produce_block();
  ASSERT_TRUE(block.has_value());

  fixture.reopen();
  auto info = fixture.engine().info();
  EXPECT_EQ(info.last_block_height, 1u);
  EXPECT_EQ(info.last_block_state_root, block->state_root);
  EXPECT_TRUE(fixture.engine().is_verified(make_hash(40)));
  EXPECT_EQ(fixture.engine().account(fixture.owner_key().public_key()).nonce,
            1u);

  ASSERT_EQ(fixture.submit(fixture.owner_key(), 1, make_hash(41)).code, 0u);
  auto next = fixture.engine().produce_block();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->height, 2u);
}

TEST(registry_engine, state_root_is_deterministic) {
  auto lhs = registry_fixture{"veritas_engine_root_lhs"};
  auto rhs = registry_fixture{"veritas_engine_root_rhs"};
  for (auto* fixture : {&lhs, &rhs}) {
    ASSERT_EQ(fixture->submit(fixture->owner_key(), 0, make_hash(40)).code,
              0u);
    ASSERT_EQ(fixture->submit(fixture->owner_key(), 1, make_hash(40)).code,
              0u);
  }
  auto lhs_block = lhs.engine().produce_block();
  auto rhs_block = rhs.engine().produce_block();
  ASSERT_TRUE(lhs_block.has_value());
  ASSERT_TRUE(rhs_block.has_value());
  EXPECT_EQ(lhs_block->state_root, rhs_block->state_root);
  EXPECT_NE(lhs_block->state_root, make_zero_hash());
}
