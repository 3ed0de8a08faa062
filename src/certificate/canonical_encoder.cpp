#include <veritas/certificate/canonical_encoder.hpp>
#include <veritas/schema/encoding/scale/encoder.hpp>

#include <array>
#include <chrono>
#include <cstdio>
#include <tuple>
#include <utility>

namespace veritas::certificate {

namespace {

bool is_space(const char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' ||
         c == '\v';
}

char to_lower(const char c) {
  if (c >= 'A' && c <= 'Z') {
    return static_cast<char>(c - 'A' + 'a');
  }
  return c;
}

std::optional<unsigned> parse_digits(const std::string_view& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  auto out = 0u;
  for (const auto c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    out = (out * 10u) + static_cast<unsigned>(c - '0');
  }
  return out;
}

struct date_parts final {
  std::string_view year;
  std::string_view month;
  std::string_view day;
};

std::optional<date_parts> split_date(const std::string_view& value) {
  if (value.size() != 10) {
    return std::nullopt;
  }
  for (const auto separator : std::array{'-', '/', '.'}) {
    if (value[4] == separator && value[7] == separator) {
      return date_parts{value.substr(0, 4), value.substr(5, 2),
                        value.substr(8, 2)};
    }
    if (value[2] == separator && value[5] == separator) {
      return date_parts{value.substr(6, 4), value.substr(3, 2),
                        value.substr(0, 2)};
    }
  }
  return std::nullopt;
}

bool require(const std::string& value,
             const std::string_view& name,
             std::string& error) {
  if (value.empty()) {
    error = std::string{name} + " is required";
    return false;
  }
  return true;
}

}  // namespace

std::string normalize_text(const std::string_view& value) {
  auto out = std::string{};
  out.reserve(value.size());
  auto pending_space = false;
  for (const auto c : value) {
    if (is_space(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(to_lower(c));
  }
  return out;
}

std::optional<std::string> normalize_date(const std::string_view& value,
                                          std::string& error) {
  auto trimmed = normalize_text(value);
  auto parts = split_date(trimmed);
  if (!parts) {
    error = "issue date '" + trimmed + "' is not in a supported format";
    return std::nullopt;
  }
  auto year = parse_digits(parts->year);
  auto month = parse_digits(parts->month);
  auto day = parse_digits(parts->day);
  if (!year || !month || !day) {
    error = "issue date '" + trimmed + "' is not numeric";
    return std::nullopt;
  }
  auto date = std::chrono::year_month_day{
      std::chrono::year{static_cast<int>(*year)}, std::chrono::month{*month},
      std::chrono::day{*day}};
  if (!date.ok()) {
    error = "issue date '" + trimmed + "' is not a calendar date";
    return std::nullopt;
  }
  auto out = std::array<char, 11>{};
  std::snprintf(out.data(), out.size(), "%04u-%02u-%02u", *year, *month, *day);
  return std::string{out.data(), 10};
}

std::optional<veritas::schema::certificate_fields_t> normalize(
    const veritas::schema::certificate_fields_t& fields,
    std::string& error) {
  auto out = veritas::schema::certificate_fields_t{};
  out.institution_id = normalize_text(fields.institution_id);
  out.student_name = normalize_text(fields.student_name);
  out.roll_number = normalize_text(fields.roll_number);
  out.course_name = normalize_text(fields.course_name);
  out.grade = normalize_text(fields.grade);
  if (!require(out.institution_id, "institution_id", error) ||
      !require(out.student_name, "student_name", error) ||
      !require(out.roll_number, "roll_number", error) ||
      !require(out.course_name, "course_name", error) ||
      !require(out.grade, "grade", error)) {
    return std::nullopt;
  }
  if (normalize_text(fields.issue_date).empty()) {
    error = "issue_date is required";
    return std::nullopt;
  }
  auto date = normalize_date(fields.issue_date, error);
  if (!date) {
    return std::nullopt;
  }
  out.issue_date = std::move(date.value());
  return out;
}

std::optional<veritas::schema::bytes_t> canonicalize(
    const veritas::schema::certificate_fields_t& fields,
    std::string& error) {
  auto normalized = normalize(fields, error);
  if (!normalized) {
    return std::nullopt;
  }
  auto encoder = veritas::scale_encoder_t{};
  return encoder.encode(std::tuple{
      std::string{kCanonicalDomain}, normalized->institution_id,
      normalized->student_name, normalized->roll_number,
      normalized->course_name, normalized->grade, normalized->issue_date});
}

std::string make_lookup_key(const std::string_view& institution_id,
                            const std::string_view& roll_number) {
  auto encoder = veritas::scale_encoder_t{};
  return veritas::schema::make_string(encoder.encode(
      std::tuple{std::string{institution_id}, std::string{roll_number}}));
}

}  // namespace veritas::certificate
