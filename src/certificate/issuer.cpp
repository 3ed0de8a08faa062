#include <spdlog/spdlog.h>
#include <veritas/certificate/canonical_encoder.hpp>
#include <veritas/certificate/issuer.hpp>

#include <chrono>
#include <utility>

using namespace veritas::schema;

namespace veritas::certificate {

namespace {

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace

bool registered(const issuance_result_t& result) {
  return !result.chain_error ||
         result.chain_error.value() == chain_error_code::duplicate_entry;
}

issuer::issuer(const hash_engine& engine,
               record_store& records,
               veritas::chain::client& chain)
    : engine_{engine}, records_{records}, chain_{chain} {}

std::optional<issuance_result_t> issuer::issue(
    const certificate_fields_t& fields,
    std::string& error) {
  auto normalized = normalize(fields, error);
  if (!normalized) {
    return std::nullopt;
  }
  auto issued = engine_.issue(normalized.value(), error);
  if (!issued) {
    return std::nullopt;
  }

  auto result = issuance_result_t{};
  result.record.fields = std::move(normalized.value());
  result.record.salt = std::move(issued->salt);
  result.record.fingerprint = issued->fingerprint;
  result.record.signature = issued->signature;
  result.record.signer = issued->signer;
  result.record.issued_at = now_milliseconds();

  if (!records_.insert(result.record, error)) {
    spdlog::warn("Refusing to issue certificate: {}", error);
    return std::nullopt;
  }
  spdlog::info("Issued certificate {} for institution '{}'",
               to_hex(result.record.fingerprint),
               result.record.fields.institution_id);

  register_record(result);
  return result;
}

std::optional<issuance_result_t> issuer::retry_registration(
    const fingerprint_t& fingerprint,
    std::string& error) {
  auto record = records_.find_by_fingerprint(fingerprint);
  if (!record) {
    error = "no record with fingerprint " + to_hex(fingerprint);
    return std::nullopt;
  }
  auto result = issuance_result_t{};
  result.record = std::move(record.value());
  result.transaction_id = records_.transaction_id(fingerprint);
  if (result.transaction_id) {
    spdlog::info("Certificate {} already registered in transaction {}",
                 to_hex(fingerprint), to_hex(*result.transaction_id));
    return result;
  }
  register_record(result);
  return result;
}

void issuer::register_record(issuance_result_t& result) {
  auto registration = chain_.register_fingerprint(result.record.fingerprint);
  result.chain_error = registration.error;
  result.chain_message = std::move(registration.message);
  if (registration.transaction_id) {
    result.transaction_id = registration.transaction_id;
    records_.set_transaction_id(result.record.fingerprint,
                                *registration.transaction_id);
  }
  if (result.chain_error &&
      result.chain_error.value() != chain_error_code::duplicate_entry) {
    spdlog::warn(
        "Certificate {} stored but not registered on chain ({}): {}; retry "
        "registration later",
        to_hex(result.record.fingerprint), to_string(*result.chain_error),
        result.chain_message);
  }
}

}  // namespace veritas::certificate
