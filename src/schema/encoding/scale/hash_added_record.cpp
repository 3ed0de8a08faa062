#include <veritas/schema/encoding/scale/hash_added_record.hpp>

namespace veritas::schema {

void encode(const hash_added_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.height, encoder);
  encode(o.index, encoder);
  encode(o.transaction_id, encoder);
  encode(o.fingerprint, encoder);
}

void decode(hash_added_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.height, decoder);
  decode(o.index, decoder);
  decode(o.transaction_id, decoder);
  decode(o.fingerprint, decoder);
}

}  // namespace veritas::schema
