#include <veritas/schema/encoding/scale/transaction_receipt.hpp>

namespace veritas::schema {

void encode(const transaction_receipt<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.height, encoder);
  encode(o.index, encoder);
  encode(o.result, encoder);
}

void decode(transaction_receipt<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.height, decoder);
  decode(o.index, decoder);
  decode(o.result, decoder);
}

}  // namespace veritas::schema
