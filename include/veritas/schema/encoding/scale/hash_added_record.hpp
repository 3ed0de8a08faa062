#pragma once
#include <veritas/schema/hash_added_record.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace veritas::schema {

void encode(const hash_added_record<1>& o, ::scale::Encoder& encoder);
void decode(hash_added_record<1>& o, ::scale::Decoder& decoder);

}  // namespace veritas::schema
