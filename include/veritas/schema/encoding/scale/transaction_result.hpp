#pragma once
#include <veritas/schema/transaction_result.hpp>
#include <veritas/schema/encoding/scale/transaction_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace veritas::schema {

void encode(const transaction_result<1>& o, ::scale::Encoder& encoder);
void decode(transaction_result<1>& o, ::scale::Decoder& decoder);

}  // namespace veritas::schema
