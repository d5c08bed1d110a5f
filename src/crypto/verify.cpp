#include <sentinel/crypto/verify.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>

#include <array>
#include <memory>
#include <optional>
#include <vector>

namespace sentinel::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;

evp_pkey_ptr make_ed25519_key(
    const sentinel::schema::ed25519_signer_id& signer) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                  signer.public_key.data(),
                                  signer.public_key.size()),
      EVP_PKEY_free};
}

evp_pkey_ptr make_secp256k1_key(
    const sentinel::schema::secp256k1_signer_id& signer) {
  auto none = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
    return none;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(signer.public_key.data()),
                     signer.public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_key = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(ctx.get(), &raw_key, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return none;
  }
  return evp_pkey_ptr{raw_key, EVP_PKEY_free};
}

// Transactions carry Ethereum style [r || s || v] signatures. The recovery
// byte is not needed because the public key travels with the signer.
std::optional<std::vector<uint8_t>> to_der_signature(
    const sentinel::schema::secp256k1_signature_t& signature) {
  auto recovery = signature[64];
  if (recovery > 3 && recovery != 27 && recovery != 28) {
    return std::nullopt;
  }

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  if (!ecdsa_sig || !r || !s) {
    return std::nullopt;
  }
  if (ECDSA_SIG_set0(ecdsa_sig.get(), r.get(), s.get()) != 1) {
    return std::nullopt;
  }
  // ECDSA_SIG owns r and s from here on.
  static_cast<void>(r.release());
  static_cast<void>(s.release());

  auto der_size = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_size <= 0) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_size));
  auto* cursor = der.data();
  if (i2d_ECDSA_SIG(ecdsa_sig.get(), &cursor) != der_size) {
    return std::nullopt;
  }
  return der;
}

bool digest_verify(EVP_PKEY* key,
                   const EVP_MD* digest,
                   const uint8_t* signature,
                   const size_t signature_size,
                   const sentinel::schema::bytes_view_t& message) {
  if (key == nullptr) {
    return false;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx ||
      EVP_DigestVerifyInit(ctx.get(), nullptr, digest, nullptr, key) != 1) {
    return false;
  }
  return EVP_DigestVerify(ctx.get(), signature, signature_size, message.data(),
                          message.size()) == 1;
}

}  // namespace

bool available() {
  static const auto available_now = [] {
    auto ed25519 = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr), EVP_PKEY_CTX_free};
    auto ec = evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    return ed25519 != nullptr && ec != nullptr;
  }();
  return available_now;
}

bool verify_signature(const sentinel::schema::bytes_view_t& message,
                      const sentinel::schema::signer_id_t& signer,
                      const sentinel::schema::signature_t& signature) {
  return std::visit(
      overloaded{
          [&](const sentinel::schema::ed25519_signer_id& value) {
            const auto* raw =
                std::get_if<sentinel::schema::ed25519_signature_t>(&signature);
            if (raw == nullptr) {
              return false;
            }
            auto key = make_ed25519_key(value);
            return digest_verify(key.get(), nullptr, raw->data(), raw->size(),
                                 message);
          },
          [&](const sentinel::schema::secp256k1_signer_id& value) {
            const auto* raw = std::get_if<
                sentinel::schema::secp256k1_signature_t>(&signature);
            if (raw == nullptr) {
              return false;
            }
            auto der = to_der_signature(*raw);
            if (!der) {
              return false;
            }
            auto key = make_secp256k1_key(value);
            return digest_verify(key.get(), EVP_sha256(), der->data(),
                                 der->size(), message);
          },
          [](const sentinel::schema::named_signer_t&) { return false; }},
      signer);
}

}  // namespace sentinel::crypto
