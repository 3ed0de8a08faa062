#pragma once
#include <veritas/schema/add_certificate_hash.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace veritas::schema {

void encode(const add_certificate_hash<1>& o, ::scale::Encoder& encoder);
void decode(add_certificate_hash<1>& o, ::scale::Decoder& decoder);

}  // namespace veritas::schema
