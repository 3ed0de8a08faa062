#include <veritas/schema/encoding/scale/add_certificate_hash.hpp>

namespace veritas::schema {

void encode(const add_certificate_hash<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.fingerprint, encoder);
}

void decode(add_certificate_hash<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.fingerprint, decoder);
}

}  // namespace veritas::schema
