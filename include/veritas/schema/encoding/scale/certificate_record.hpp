#pragma once
#include <veritas/schema/certificate_record.hpp>
#include <veritas/schema/encoding/scale/certificate_fields.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace veritas::schema {

void encode(const certificate_record<1>& o, ::scale::Encoder& encoder);
void decode(certificate_record<1>& o, ::scale::Decoder& decoder);

}  // namespace veritas::schema
