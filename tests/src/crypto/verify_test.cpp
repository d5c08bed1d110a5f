#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <sentinel/crypto/verify.hpp>

#include <array>
#include <optional>
#include <vector>

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif

namespace {

struct secp_fixture_t final {
  sentinel::schema::secp256k1_signer_id signer;
  sentinel::schema::secp256k1_signature_t signature;
  std::vector<uint8_t> message;
};

// Signs with a fresh secp256k1 key and packs the result as [r || s || v].
std::optional<secp_fixture_t> make_secp_fixture() {
  auto* ec_key = EC_KEY_new_by_curve_name(NID_secp256k1);
  if (ec_key == nullptr) {
    return std::nullopt;
  }
  if (EC_KEY_generate_key(ec_key) != 1) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  EC_KEY_set_conv_form(ec_key, POINT_CONVERSION_COMPRESSED);

  auto compressed = std::array<uint8_t, 33>{};
  auto* pub_ptr = compressed.data();
  auto pub_len = i2o_ECPublicKey(ec_key, &pub_ptr);
  if (pub_len != static_cast<long>(compressed.size())) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  auto* pkey = EVP_PKEY_new();
  if (pkey == nullptr) {
    EC_KEY_free(ec_key);
    return std::nullopt;
  }
  if (EVP_PKEY_assign_EC_KEY(pkey, ec_key) != 1) {
    EVP_PKEY_free(pkey);
    EC_KEY_free(ec_key);
    return std::nullopt;
  }

  auto message = std::vector<uint8_t>{'a', 'u', 'd', 'i', 't', '-', 'f', 'e',
                                      'e'};
  auto* sign_ctx = EVP_MD_CTX_new();
  if (sign_ctx == nullptr) {
    EVP_PKEY_free(pkey);
    return std::nullopt;
  }
  if (EVP_DigestSignInit(sign_ctx, nullptr, EVP_sha256(), nullptr, pkey) != 1) {
    EVP_MD_CTX_free(sign_ctx);
    EVP_PKEY_free(pkey);
    return std::nullopt;
  }
  auto der_size = size_t{};
  if (EVP_DigestSign(sign_ctx, nullptr, &der_size, message.data(),
                     message.size()) != 1) {
    EVP_MD_CTX_free(sign_ctx);
    EVP_PKEY_free(pkey);
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_DigestSign(sign_ctx, der.data(), &der_size, message.data(),
                     message.size()) != 1) {
    EVP_MD_CTX_free(sign_ctx);
    EVP_PKEY_free(pkey);
    return std::nullopt;
  }
  EVP_MD_CTX_free(sign_ctx);
  EVP_PKEY_free(pkey);

  const auto* der_ptr = der.data();
  auto* sig = d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size));
  if (sig == nullptr) {
    return std::nullopt;
  }

  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig, &r, &s);

  auto compact = sentinel::schema::secp256k1_signature_t{};
  auto ok_r = BN_bn2binpad(r, compact.data(), 32);
  auto ok_s = BN_bn2binpad(s, compact.data() + 32, 32);
  compact[64] = 27;
  ECDSA_SIG_free(sig);
  if (ok_r != 32 || ok_s != 32) {
    return std::nullopt;
  }

  return secp_fixture_t{
      .signer = sentinel::schema::secp256k1_signer_id{.public_key = compressed},
      .signature = compact,
      .message = std::move(message)};
}

bool verify(const secp_fixture_t& fixture) {
  return sentinel::crypto::verify_signature(
      sentinel::schema::bytes_view_t{fixture.message.data(),
                                     fixture.message.size()},
      sentinel::schema::signer_id_t{fixture.signer},
      sentinel::schema::signature_t{fixture.signature});
}

}  // namespace

TEST(crypto_verify, verifies_ed25519_signatures) {
  if (!sentinel::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto* keygen_ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_ED25519, nullptr);
  ASSERT_NE(keygen_ctx, nullptr);
  ASSERT_EQ(EVP_PKEY_keygen_init(keygen_ctx), 1);
  auto* pkey = static_cast<EVP_PKEY*>(nullptr);
  ASSERT_EQ(EVP_PKEY_keygen(keygen_ctx, &pkey), 1);
  EVP_PKEY_CTX_free(keygen_ctx);

  auto public_key = std::array<uint8_t, 32>{};
  auto public_key_size = public_key.size();
  ASSERT_EQ(
      EVP_PKEY_get_raw_public_key(pkey, public_key.data(), &public_key_size),
      1);
  ASSERT_EQ(public_key_size, public_key.size());

  auto message = std::vector<uint8_t>{'s', 'e', 'n', 't', 'i', 'n', 'e', 'l'};
  auto signature = std::array<uint8_t, 64>{};
  auto signature_size = signature.size();
  auto* sign_ctx = EVP_MD_CTX_new();
  ASSERT_NE(sign_ctx, nullptr);
  ASSERT_EQ(EVP_DigestSignInit(sign_ctx, nullptr, nullptr, nullptr, pkey), 1);
  ASSERT_EQ(EVP_DigestSign(sign_ctx, signature.data(), &signature_size,
                           message.data(), message.size()),
            1);
  EVP_MD_CTX_free(sign_ctx);
  EVP_PKEY_free(pkey);
  ASSERT_EQ(signature_size, signature.size());

  auto signer = sentinel::schema::signer_id_t{
      sentinel::schema::ed25519_signer_id{.public_key = public_key}};
  auto signature_variant = sentinel::schema::signature_t{signature};
  EXPECT_TRUE(sentinel::crypto::verify_signature(
      sentinel::schema::bytes_view_t{message.data(), message.size()}, signer,
      signature_variant));

  message[0] ^= 0x01;
  EXPECT_FALSE(sentinel::crypto::verify_signature(
      sentinel::schema::bytes_view_t{message.data(), message.size()}, signer,
      signature_variant));
}

TEST(crypto_verify, verifies_secp256k1_signatures) {
  if (!sentinel::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  EXPECT_TRUE(verify(*fixture));

  fixture->message[0] ^= 0x01;
  EXPECT_FALSE(verify(*fixture));
}

TEST(crypto_verify, accepts_every_supported_recovery_byte) {
  if (!sentinel::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  for (const auto v : std::array<uint8_t, 6>{0, 1, 2, 3, 27, 28}) {
    fixture->signature[64] = v;
    EXPECT_TRUE(verify(*fixture)) << "recovery byte " << static_cast<int>(v);
  }
}

TEST(crypto_verify, rejects_invalid_secp256k1_recovery_byte) {
  if (!sentinel::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  fixture->signature[64] = 7;
  EXPECT_FALSE(verify(*fixture));
}

TEST(crypto_verify, rejects_tampered_secp256k1_scalars) {
  if (!sentinel::crypto::available()) {
    GTEST_SKIP() << "OpenSSL backend does not expose required crypto providers";
  }
  auto fixture = make_secp_fixture();
  ASSERT_TRUE(fixture.has_value());
  fixture->signature[40] ^= 0x01;
  EXPECT_FALSE(verify(*fixture));
}

TEST(crypto_verify, rejects_mismatched_signer_and_signature_variants) {
  auto ed_signer = sentinel::schema::ed25519_signer_id{};
  ed_signer.public_key[0] = 1;
  auto secp_signature = sentinel::schema::secp256k1_signature_t{};

  EXPECT_FALSE(sentinel::crypto::verify_signature(
      sentinel::schema::bytes_view_t{},
      sentinel::schema::signer_id_t{ed_signer},
      sentinel::schema::signature_t{secp_signature}));
}

TEST(crypto_verify, rejects_named_signer_signatures) {
  auto named = sentinel::schema::named_signer_t{};
  named[0] = 0x42;
  auto signature = sentinel::schema::ed25519_signature_t{};
  auto message = std::array<uint8_t, 3>{'a', 'b', 'c'};
  EXPECT_FALSE(sentinel::crypto::verify_signature(
      sentinel::schema::bytes_view_t{message.data(), message.size()},
      sentinel::schema::signer_id_t{named},
      sentinel::schema::signature_t{signature}));
}

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif
