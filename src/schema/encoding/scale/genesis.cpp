#include <veritas/schema/encoding/scale/genesis.hpp>

namespace veritas::schema {

void encode(const genesis<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.owner, encoder);
  encode(o.owner_balance, encoder);
  encode(o.gas_price, encoder);
}

void decode(genesis<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.owner, decoder);
  decode(o.owner_balance, decoder);
  decode(o.gas_price, decoder);
}

}  // namespace veritas::schema
