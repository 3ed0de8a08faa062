#pragma once
#include <veritas/schema/transaction.hpp>
#include <veritas/schema/encoding/scale/add_certificate_hash.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace veritas::schema {

void encode(const transaction<1>& o, ::scale::Encoder& encoder);
void decode(transaction<1>& o, ::scale::Decoder& decoder);

}  // namespace veritas::schema
