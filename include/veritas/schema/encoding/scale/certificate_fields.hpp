#pragma once
#include <veritas/schema/certificate_fields.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Found by argument-dependent lookup from the SCALE library, so these
// definitions fix the field order of the persisted/wire layout.
namespace veritas::schema {

void encode(const certificate_fields<1>& o, ::scale::Encoder& encoder);
void decode(certificate_fields<1>& o, ::scale::Decoder& decoder);

}  // namespace veritas::schema
