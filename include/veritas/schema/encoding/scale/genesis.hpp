#pragma once
#include <veritas/schema/genesis.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace veritas::schema {

void encode(const genesis<1>& o, ::scale::Encoder& encoder);
void decode(genesis<1>& o, ::scale::Decoder& decoder);

}  // namespace veritas::schema
