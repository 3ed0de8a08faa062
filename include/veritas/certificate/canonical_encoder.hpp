#pragma once

#include <veritas/schema/certificate_fields.hpp>
#include <veritas/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace veritas::certificate {

/// Domain tag leading every canonical encoding.
inline constexpr auto kCanonicalDomain =
    std::string_view{"veritas-certificate-v1"};

/// Trim, collapse internal whitespace runs to one space, ASCII-lowercase.
/// Bytes outside ASCII pass through unchanged.
std::string normalize_text(const std::string_view& value);

/// Parse YYYY-MM-DD, YYYY/MM/DD, YYYY.MM.DD, DD-MM-YYYY, DD/MM/YYYY or
/// DD.MM.YYYY into ISO YYYY-MM-DD. The date must exist in the calendar.
std::optional<std::string> normalize_date(const std::string_view& value,
                                          std::string& error);

/// Normalized copy of `fields`, or std::nullopt when a field is empty after
/// normalization or the issue date is invalid.
std::optional<veritas::schema::certificate_fields_t> normalize(
    const veritas::schema::certificate_fields_t& fields,
    std::string& error);

/// Deterministic byte encoding of the certificate: the SCALE encoding of
/// (domain, institution, student, roll, course, grade, date) after
/// normalization. Every string carries its length, so no separator can be
/// forged by field content.
std::optional<veritas::schema::bytes_t> canonicalize(
    const veritas::schema::certificate_fields_t& fields,
    std::string& error);

/// Record store lookup key built from already normalized values.
std::string make_lookup_key(const std::string_view& institution_id,
                            const std::string_view& roll_number);

}  // namespace veritas::certificate
