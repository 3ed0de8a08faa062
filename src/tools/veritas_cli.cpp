#include <boost/program_options.hpp>
#include <grpcpp/grpcpp.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <veritas/certificate/canonical_encoder.hpp>
#include <veritas/certificate/hash_engine.hpp>
#include <veritas/certificate/issuer.hpp>
#include <veritas/certificate/orchestrator.hpp>
#include <veritas/certificate/record_store.hpp>
#include <veritas/chain/grpc_client.hpp>
#include <veritas/config/config.hpp>
#include <veritas/crypto/signing_key.hpp>
#include <veritas/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

namespace {

namespace po = boost::program_options;

using storage_t =
    veritas::storage::storage<veritas::storage::rocksdb_storage_tag>;

enum exit_code : int {
  kOk = 0,
  kUsage = 1,
  kRejected = 2,
  kChainFailure = 3,
  kNotVerified = 4,
};

struct field_options final {
  veritas::schema::certificate_fields_t fields;
  std::string salt;
  std::string fingerprint;
  std::string lookup_key;
  uint32_t page{1};
  uint32_t limit{10};
};

po::options_description make_field_options(field_options& options) {
  auto description = po::options_description{"certificate"};
  description.add_options()(
      "institution", po::value<std::string>(&options.fields.institution_id),
      "issuing institution identifier")(
      "student", po::value<std::string>(&options.fields.student_name),
      "student name")("roll",
                      po::value<std::string>(&options.fields.roll_number),
                      "roll / student id")(
      "course", po::value<std::string>(&options.fields.course_name),
      "course name")("grade", po::value<std::string>(&options.fields.grade),
                     "grade")(
      "date", po::value<std::string>(&options.fields.issue_date),
      "issue date (YYYY-MM-DD, DD/MM/YYYY, ...)")(
      "salt", po::value<std::string>(&options.salt),
      "salt (hex) for the fingerprint command")(
      "fingerprint", po::value<std::string>(&options.fingerprint),
      "certificate fingerprint (hex)")(
      "lookup-institution", po::value<std::string>(&options.lookup_key),
      "verify against the record of another institution")(
      "page",
      po::value<uint32_t>(&options.page)->default_value(options.page),
      "page of the list command, starting at 1")(
      "limit",
      po::value<uint32_t>(&options.limit)->default_value(options.limit),
      "records per page of the list command (1-100)");
  return description;
}

void print_record(const veritas::schema::certificate_record_t& record) {
  std::cout << "fingerprint: " << veritas::schema::to_hex(record.fingerprint)
            << '\n'
            << "salt: " << veritas::schema::to_hex(record.salt) << '\n'
            << "signature: " << veritas::schema::to_hex(record.signature)
            << '\n'
            << "signer: " << veritas::schema::to_hex(record.signer) << '\n'
            << "institution: " << record.fields.institution_id << '\n'
            << "student: " << record.fields.student_name << '\n'
            << "roll: " << record.fields.roll_number << '\n'
            << "course: " << record.fields.course_name << '\n'
            << "grade: " << record.fields.grade << '\n'
            << "date: " << record.fields.issue_date << '\n';
}

int print_issuance(const veritas::schema::issuance_result_t& result) {
  print_record(result.record);
  if (result.transaction_id) {
    std::cout << "transaction: "
              << veritas::schema::to_hex(*result.transaction_id) << '\n';
  }
  if (result.chain_error) {
    std::cout << "chain_error: " << to_string(*result.chain_error) << '\n'
              << "chain_message: " << result.chain_message << '\n';
  }
  return veritas::certificate::registered(result) ? kOk : kChainFailure;
}

/// Everything the issue/verify/register/status commands share.
struct session final {
  veritas::scale_encoder_t encoder;
  storage_t storage;
  veritas::certificate::rocksdb_record_store records;
  veritas::chain::grpc_client chain;
  veritas::certificate::hash_engine engine;
  veritas::schema::public_key_t trusted_key;

  session(const veritas::config::client_config& config,
          const veritas::crypto::signing_key& key,
          const veritas::schema::public_key_t& trusted)
      : storage{veritas::storage::make_storage<
            veritas::storage::rocksdb_storage_tag>(config.records_db_path)},
        records{encoder, storage},
        chain{grpc::CreateChannel(config.registry_endpoint,
                                  grpc::InsecureChannelCredentials()),
              key, veritas::config::make_grpc_client_options(config)},
        engine{key},
        trusted_key{trusted} {}
};

int run_keygen() {
  auto key = veritas::crypto::signing_key::generate();
  std::cout << "private_key: " << veritas::schema::to_hex(key.seed()) << '\n'
            << "public_key: " << veritas::schema::to_hex(key.public_key())
            << '\n';
  return kOk;
}

int run_fingerprint(const field_options& options) {
  auto salt = veritas::schema::try_from_hex(options.salt);
  if (!salt) {
    std::cerr << "--salt must be hex" << std::endl;
    return kUsage;
  }
  auto error = std::string{};
  auto canonical = veritas::certificate::canonicalize(options.fields, error);
  if (!canonical) {
    std::cerr << error << std::endl;
    return kRejected;
  }
  auto fingerprint = veritas::certificate::hash_engine::recompute(
      options.fields, *salt, error);
  if (!fingerprint) {
    std::cerr << error << std::endl;
    return kRejected;
  }
  std::cout << "canonical: " << veritas::schema::to_hex(*canonical) << '\n'
            << "fingerprint: " << veritas::schema::to_hex(*fingerprint)
            << '\n';
  return kOk;
}

int run_list(const veritas::config::client_config& config,
             const field_options& options) {
  auto institution =
      veritas::certificate::normalize_text(options.fields.institution_id);
  if (institution.empty()) {
    std::cerr << "--institution is required" << std::endl;
    return kUsage;
  }
  auto encoder = veritas::scale_encoder_t{};
  auto storage =
      veritas::storage::make_storage<veritas::storage::rocksdb_storage_tag>(
          config.records_db_path);
  auto records = veritas::certificate::rocksdb_record_store{encoder, storage};
  auto error = std::string{};
  auto page = records.list_by_institution(institution, options.page,
                                          options.limit, error);
  if (!page) {
    std::cerr << error << std::endl;
    return kUsage;
  }
  std::cout << "page: " << page->page << '/' << total_pages(*page) << '\n'
            << "total: " << page->total << '\n';
  for (const auto& listed : page->certificates) {
    std::cout << '\n';
    print_record(listed.record);
    if (listed.transaction_id) {
      std::cout << "transaction: "
                << veritas::schema::to_hex(*listed.transaction_id) << '\n';
    }
  }
  return kOk;
}

int run_issue(session& s, const field_options& options) {
  auto issuer =
      veritas::certificate::issuer{s.engine, s.records, s.chain};
  auto error = std::string{};
  auto result = issuer.issue(options.fields, error);
  if (!result) {
    std::cerr << error << std::endl;
    return kRejected;
  }
  return print_issuance(*result);
}

int run_register(session& s, const field_options& options) {
  auto fingerprint = veritas::schema::try_make_hash32(
      std::string_view{options.fingerprint});
  if (!fingerprint) {
    std::cerr << "--fingerprint must be 32 bytes of hex" << std::endl;
    return kUsage;
  }
  auto issuer =
      veritas::certificate::issuer{s.engine, s.records, s.chain};
  auto error = std::string{};
  auto result = issuer.retry_registration(*fingerprint, error);
  if (!result) {
    std::cerr << error << std::endl;
    return kRejected;
  }
  return print_issuance(*result);
}

int run_verify(session& s, const field_options& options) {
  auto orchestrator =
      veritas::certificate::orchestrator{s.records, s.chain, s.trusted_key};
  auto error = std::string{};
  auto result = std::optional<veritas::schema::verification_result_t>{};
  if (options.lookup_key.empty()) {
    result = orchestrator.verify(options.fields, error);
  } else {
    auto lookup = veritas::certificate::make_lookup_key(
        veritas::certificate::normalize_text(options.lookup_key),
        veritas::certificate::normalize_text(options.fields.roll_number));
    result = orchestrator.verify(options.fields, lookup, error);
  }
  if (!result) {
    std::cerr << error << std::endl;
    return kRejected;
  }
  std::cout << "verdict: " << to_string(result->verdict) << '\n'
            << "reason: " << result->reason << '\n';
  if (result->record) {
    std::cout << "fingerprint: "
              << veritas::schema::to_hex(result->record->fingerprint) << '\n';
  }
  if (result->transaction_id) {
    std::cout << "transaction: "
              << veritas::schema::to_hex(*result->transaction_id) << '\n';
  }
  switch (result->verdict) {
    case veritas::schema::verification_verdict_t::verified_on_chain:
      return kOk;
    case veritas::schema::verification_verdict_t::chain_unreachable:
      return kChainFailure;
    default:
      return kNotVerified;
  }
}

int run_status(session& s, const field_options& options) {
  auto fingerprint = veritas::schema::try_make_hash32(
      std::string_view{options.fingerprint});
  if (!fingerprint) {
    std::cerr << "--fingerprint must be 32 bytes of hex" << std::endl;
    return kUsage;
  }
  auto record = s.records.find_by_fingerprint(*fingerprint);
  if (record) {
    print_record(*record);
  } else {
    std::cout << "record: none\n";
  }
  if (auto transaction_id = s.records.transaction_id(*fingerprint)) {
    std::cout << "transaction: " << veritas::schema::to_hex(*transaction_id)
              << '\n';
  }
  auto on_chain = s.chain.verify(*fingerprint);
  if (on_chain.error) {
    std::cout << "chain_error: " << to_string(*on_chain.error) << '\n'
              << "chain_message: " << on_chain.message << '\n';
    return kChainFailure;
  }
  std::cout << "on_chain: "
            << (on_chain.verified.value_or(false) ? "true" : "false") << '\n';
  return kOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("veritas"));

  auto command = std::string{};
  auto config = veritas::config::client_config{};
  auto fields = field_options{};
  auto description = veritas::config::make_options(config);
  description.add_options()(
      "command", po::value<std::string>(&command),
      "keygen|fingerprint|list|issue|verify|register|status");
  description.add(make_field_options(fields));

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  auto error = std::string{};
  if (!veritas::config::parse(argc, argv, description, positional, vm,
                              error)) {
    std::cerr << error << std::endl;
    return kUsage;
  }
  spdlog::set_level(spdlog::level::from_str(config.log_level));

  if (vm.contains("help") || command.empty()) {
    std::cout << "usage: veritas <command> [options]\n" << description << '\n';
    return command.empty() && !vm.contains("help") ? kUsage : kOk;
  }
  if (command == "keygen") {
    return run_keygen();
  }
  if (command == "fingerprint") {
    return run_fingerprint(fields);
  }
  if (command == "list") {
    return run_list(config, fields);
  }

  auto key = veritas::config::load_signing_key(config, error);
  if (!key) {
    std::cerr << error << std::endl;
    return kUsage;
  }
  auto trusted = veritas::config::trusted_public_key(config, *key, error);
  if (!trusted) {
    std::cerr << error << std::endl;
    return kUsage;
  }

  if (command != "issue" && command != "verify" && command != "register" &&
      command != "status") {
    std::cerr << "command must be keygen|fingerprint|list|issue|verify|"
                 "register|status"
              << std::endl;
    return kUsage;
  }

  auto s = session{config, *key, *trusted};
  if (command == "issue") {
    return run_issue(s, fields);
  }
  if (command == "verify") {
    return run_verify(s, fields);
  }
  if (command == "register") {
    return run_register(s, fields);
  }
  return run_status(s, fields);
}
