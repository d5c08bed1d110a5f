#pragma once

#include <sentinel/schema/primitives.hpp>

namespace sentinel::crypto {

/// True when the linked OpenSSL provides both ed25519 and secp256k1.
bool available();

/// Verify a transaction signature against the signer's public key.
///
/// Named signers carry no key material and never verify.
bool verify_signature(const sentinel::schema::bytes_view_t& message,
                      const sentinel::schema::signer_id_t& signer,
                      const sentinel::schema::signature_t& signature);

}  // namespace sentinel::crypto
