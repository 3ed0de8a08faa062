#pragma once
#include <veritas/schema/account_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace veritas::schema {

void encode(const account_state<1>& o, ::scale::Encoder& encoder);
void decode(account_state<1>& o, ::scale::Decoder& decoder);

}  // namespace veritas::schema
