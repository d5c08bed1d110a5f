#pragma once
#include <sentinel/schema/primitives.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Declared in sentinel::schema so the library finds them by ADL when it walks
// variants and containers of schema types.
namespace sentinel::schema {

void encode(const ed25519_signer_id& o, ::scale::Encoder& encoder);
void decode(ed25519_signer_id& o, ::scale::Decoder& decoder);

void encode(const secp256k1_signer_id& o, ::scale::Encoder& encoder);
void decode(secp256k1_signer_id& o, ::scale::Decoder& decoder);

/// Amounts travel as 32 byte big-endian integers.
void encode_amount(const amount_t& o, ::scale::Encoder& encoder);
void decode_amount(amount_t& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
