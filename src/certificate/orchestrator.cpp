#include <spdlog/spdlog.h>
#include <veritas/certificate/canonical_encoder.hpp>
#include <veritas/certificate/hash_engine.hpp>
#include <veritas/certificate/orchestrator.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

using namespace veritas::schema;

namespace veritas::certificate {

namespace {

verification_result_t make_verdict(verification_verdict_t verdict,
                                   std::string reason) {
  auto result = verification_result_t{};
  result.verdict = verdict;
  result.reason = std::move(reason);
  return result;
}

}  // namespace

orchestrator::orchestrator(const record_store& records,
                           veritas::chain::client& chain,
                           const public_key_t& trusted_key)
    : records_{records}, chain_{chain}, trusted_key_{trusted_key} {}

std::optional<verification_result_t> orchestrator::verify(
    const certificate_fields_t& candidate,
    std::string& error) const {
  auto normalized = normalize(candidate, error);
  if (!normalized) {
    return std::nullopt;
  }
  auto lookup_key =
      make_lookup_key(normalized->institution_id, normalized->roll_number);
  return verify_normalized(normalized.value(), lookup_key);
}

std::optional<verification_result_t> orchestrator::verify(
    const certificate_fields_t& candidate,
    const std::string_view& lookup_key,
    std::string& error) const {
  auto normalized = normalize(candidate, error);
  if (!normalized) {
    return std::nullopt;
  }
  return verify_normalized(normalized.value(), lookup_key);
}

verification_result_t orchestrator::verify_normalized(
    const certificate_fields_t& candidate,
    const std::string_view& lookup_key) const {
  auto candidates = records_.find_by_lookup_key(lookup_key);
  if (candidates.empty()) {
    return make_verdict(verification_verdict_t::not_found,
                        "no certificate record for this institution and roll "
                        "number");
  }

  // A roll number can hold several certificates; the candidate must
  // reproduce the fingerprint of one of them.
  auto record = std::optional<certificate_record_t>{};
  auto unusable = size_t{0};
  for (auto& stored : candidates) {
    auto recompute_error = std::string{};
    auto fingerprint =
        hash_engine::recompute(candidate, stored.salt, recompute_error);
    if (!fingerprint) {
      spdlog::error("Stored record {} cannot be recomputed: {}",
                    to_hex(stored.fingerprint), recompute_error);
      ++unusable;
      continue;
    }
    if (hash_engine::same_fingerprint(fingerprint.value(),
                                      stored.fingerprint)) {
      record = std::move(stored);
      break;
    }
  }
  if (!record) {
    return make_verdict(
        verification_verdict_t::hash_mismatch,
        unusable == candidates.size()
            ? "stored record is unusable"
            : "certificate details do not match any issued certificate");
  }

  if (record->signer != trusted_key_) {
    spdlog::warn("Record {} was signed by untrusted key {}",
                 to_hex(record->fingerprint), to_hex(record->signer));
    return make_verdict(verification_verdict_t::hash_mismatch,
                        "record was not signed by the trusted service key");
  }
  if (!hash_engine::verify_signature(record->fingerprint, record->signature,
                                     record->signer)) {
    spdlog::warn("Record {} carries an invalid signature",
                 to_hex(record->fingerprint));
    return make_verdict(verification_verdict_t::hash_mismatch,
                        "record signature does not verify");
  }

  auto on_chain = chain_.verify(record->fingerprint);
  if (on_chain.error) {
    auto result = make_verdict(verification_verdict_t::chain_unreachable,
                               "registry check failed: " + on_chain.message);
    result.chain_error = on_chain.error;
    return result;
  }

  auto result =
      on_chain.verified.value_or(false)
          ? make_verdict(verification_verdict_t::verified_on_chain,
                         "certificate matches the issued record and is "
                         "registered on chain")
          : make_verdict(verification_verdict_t::record_found_not_on_chain,
                         "certificate matches the issued record but is not "
                         "registered on chain");
  result.transaction_id = records_.transaction_id(record->fingerprint);
  result.record = std::move(record.value());
  return result;
}

}  // namespace veritas::certificate
