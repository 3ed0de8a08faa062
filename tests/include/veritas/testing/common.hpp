#pragma once

#include <veritas/crypto/signing_key.hpp>
#include <veritas/schema/certificate_fields.hpp>
#include <veritas/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace veritas::testing {

inline veritas::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = veritas::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Deterministic Ed25519 key; distinct seeds give distinct keys.
inline veritas::crypto::signing_key make_signing_key(const uint8_t seed) {
  auto error = std::string{};
  auto bytes = make_hash(seed);
  auto key = veritas::crypto::signing_key::from_seed(bytes, error);
  return key.value();
}

inline veritas::schema::certificate_fields_t make_fields() {
  auto fields = veritas::schema::certificate_fields_t{};
  fields.institution_id = "INST-001";
  fields.student_name = "Asha Verma";
  fields.roll_number = "2021CS042";
  fields.course_name = "B.Tech Computer Science";
  fields.grade = "A";
  fields.issue_date = "2024-06-15";
  return fields;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

/// Removes the directory on destruction. Declare it before anything that
/// keeps the database open.
class temporary_path final {
 public:
  explicit temporary_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}
  ~temporary_path() { remove_path(path_); }

  temporary_path(const temporary_path&) = delete;
  temporary_path& operator=(const temporary_path&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace veritas::testing
