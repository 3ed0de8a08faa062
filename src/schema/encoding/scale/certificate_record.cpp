#include <veritas/schema/encoding/scale/certificate_record.hpp>

namespace veritas::schema {

void encode(const certificate_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.fields, encoder);
  encode(o.salt, encoder);
  encode(o.fingerprint, encoder);
  encode(o.signature, encoder);
  encode(o.signer, encoder);
  encode(o.issued_at, encoder);
}

void decode(certificate_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.fields, decoder);
  decode(o.salt, decoder);
  decode(o.fingerprint, decoder);
  decode(o.signature, decoder);
  decode(o.signer, decoder);
  decode(o.issued_at, decoder);
}

}  // namespace veritas::schema
