#pragma once
#include <cstdint>
#include <string>

// Schema type: certificate fields.
// Semantic content of one academic certificate as supplied by the issuing
// institution (or extracted from an uploaded document during verification).
namespace veritas::schema {

template <uint16_t Version>
struct certificate_fields;

template <>
struct certificate_fields<1> final {
  uint16_t version{1};
  std::string institution_id;
  std::string student_name;
  std::string roll_number;
  std::string course_name;
  std::string grade;
  // Calendar date, no time component. Normalized to YYYY-MM-DD.
  std::string issue_date;
};

using certificate_fields_t = certificate_fields<1>;

}  // namespace veritas::schema
