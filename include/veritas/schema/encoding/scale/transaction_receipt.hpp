#pragma once
#include <veritas/schema/transaction_receipt.hpp>
#include <veritas/schema/encoding/scale/transaction_result.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace veritas::schema {

void encode(const transaction_receipt<1>& o, ::scale::Encoder& encoder);
void decode(transaction_receipt<1>& o, ::scale::Decoder& decoder);

}  // namespace veritas::schema
