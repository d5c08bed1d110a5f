#include <sentinel/schema/encoding/scale/primitives.hpp>

namespace sentinel::schema {

void encode(const ed25519_signer_id& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.public_key, encoder);
}

void decode(ed25519_signer_id& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.public_key, decoder);
}

void encode(const secp256k1_signer_id& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.public_key, encoder);
}

void decode(secp256k1_signer_id& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.public_key, decoder);
}

void encode_amount(const amount_t& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(make_amount_bytes(o), encoder);
}

void decode_amount(amount_t& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  auto raw = amount_bytes_t{};
  decode(raw, decoder);
  o = make_amount(raw);
}

}  // namespace sentinel::schema
