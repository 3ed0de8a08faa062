#include <veritas/schema/encoding/scale/account_state.hpp>

namespace veritas::schema {

void encode(const account_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.nonce, encoder);
  encode(o.balance, encoder);
}

void decode(account_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.nonce, decoder);
  decode(o.balance, decoder);
}

}  // namespace veritas::schema
