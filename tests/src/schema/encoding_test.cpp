#include <gtest/gtest.h>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/transaction.hpp>

#include <algorithm>
#include <string>

namespace {

using scale_encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;

sentinel::schema::account_id_t make_account(const uint8_t seed) {
  auto account = sentinel::schema::account_id_t{};
  account[0] = seed;
  return account;
}

sentinel::schema::audit_request_t make_request() {
  return sentinel::schema::audit_request_t{
      .id = 7,
      .requester = make_account(0x10),
      .target_address = make_account(0x30),
      .payment = sentinel::schema::amount_t{"10000000000000000"},
      .status = sentinel::schema::request_status_t::completed,
      .requested_at = 1'700'000'000'000,
      .completed_at = 1'700'000'360'000,
      .report_id = 42};
}

sentinel::schema::transaction_t make_publish_transaction() {
  auto chain_id = sentinel::schema::hash32_t{};
  chain_id.fill(0x5A);
  return sentinel::schema::transaction_t{
      .chain_id = chain_id,
      .nonce = 3,
      .signer = sentinel::schema::signer_id_t{
          sentinel::schema::named_signer_t{make_account(0x02)}},
      .payload = sentinel::schema::transaction_payload_t{
          sentinel::schema::publish_report_t{.target_address = make_account(0x30),
                                             .score = 88,
                                             .report_cid = "bafy-report",
                                             .critical_count = 1,
                                             .high_count = 2,
                                             .medium_count = 3,
                                             .low_count = 4}},
      .signature = sentinel::schema::signature_t{
          sentinel::schema::ed25519_signature_t{}}};
}

}  // namespace

TEST(scale_encoding, audit_request_round_trips) {
  auto encoder = scale_encoder_t{};
  auto original = make_request();
  auto encoded = encoder.encode(original);
  auto decoded = encoder.try_decode<sentinel::schema::audit_request_t>(
      sentinel::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->id, original.id);
  EXPECT_EQ(decoded->requester, original.requester);
  EXPECT_EQ(decoded->target_address, original.target_address);
  EXPECT_EQ(decoded->payment, original.payment);
  EXPECT_EQ(decoded->status, sentinel::schema::request_status_t::completed);
  EXPECT_EQ(decoded->requested_at, original.requested_at);
  EXPECT_EQ(decoded->completed_at, original.completed_at);
  EXPECT_EQ(decoded->report_id, 42u);
}

TEST(scale_encoding, rejects_unknown_request_status) {
  auto encoder = scale_encoder_t{};
  auto encoded = encoder.encode(make_request());
  // version, id, requester, target, payment precede the status byte.
  constexpr auto kStatusOffset = size_t{2 + 8 + 20 + 20 + 32};
  ASSERT_GT(encoded.size(), kStatusOffset);
  ASSERT_EQ(encoded[kStatusOffset], 2);
  encoded[kStatusOffset] = 4;
  EXPECT_FALSE(encoder
                   .try_decode<sentinel::schema::audit_request_t>(
                       sentinel::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(scale_encoding, amounts_are_fixed_width_big_endian) {
  auto encoder = scale_encoder_t{};
  auto submit = sentinel::schema::submit_request_t{
      .target_address = make_account(0x30),
      .deposit = sentinel::schema::amount_t{0x0102}};
  auto encoded = encoder.encode(submit);
  ASSERT_EQ(encoded.size(), 2u + 20u + 32u);
  EXPECT_EQ(encoded[encoded.size() - 2], 0x01);
  EXPECT_EQ(encoded[encoded.size() - 1], 0x02);
  EXPECT_EQ(encoded[22], 0x00);
}

TEST(scale_encoding, transaction_round_trips_payload_alternative) {
  auto encoder = scale_encoder_t{};
  auto original = make_publish_transaction();
  auto encoded = encoder.encode(original);
  auto decoded = encoder.try_decode<sentinel::schema::transaction_t>(
      sentinel::schema::make_bytes_view(encoded));
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->version, 1);
  EXPECT_EQ(decoded->chain_id, original.chain_id);
  EXPECT_EQ(decoded->nonce, 3u);
  ASSERT_TRUE(
      std::holds_alternative<sentinel::schema::named_signer_t>(decoded->signer));
  ASSERT_EQ(decoded->payload.index(), 12u);
  const auto& publish =
      std::get<sentinel::schema::publish_report_t>(decoded->payload);
  EXPECT_EQ(publish.score, 88);
  EXPECT_EQ(publish.report_cid, "bafy-report");
  EXPECT_EQ(publish.critical_count, 1u);
  EXPECT_EQ(publish.low_count, 4u);
}

TEST(scale_encoding, rejects_truncated_transaction) {
  auto encoder = scale_encoder_t{};
  auto encoded = encoder.encode(make_publish_transaction());
  encoded.resize(encoded.size() - 10);
  EXPECT_FALSE(encoder
                   .try_decode<sentinel::schema::transaction_t>(
                       sentinel::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(scale_encoding, rejects_unknown_payload_alternative) {
  auto encoder = scale_encoder_t{};
  auto encoded = encoder.encode(make_publish_transaction());
  // version, chain id, nonce, then the signer variant (tag + 20 bytes).
  constexpr auto kPayloadTagOffset = size_t{2 + 32 + 8 + 1 + 20};
  ASSERT_EQ(encoded[kPayloadTagOffset], 12);
  encoded[kPayloadTagOffset] = 40;
  EXPECT_FALSE(encoder
                   .try_decode<sentinel::schema::transaction_t>(
                       sentinel::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(scale_encoding, signing_payload_is_transaction_without_signature) {
  auto encoder = scale_encoder_t{};
  auto tx = make_publish_transaction();
  auto encoded = encoder.encode(tx);
  auto payload = sentinel::schema::make_signing_payload(tx);

  // Variant tag plus a 64 byte ed25519 signature.
  ASSERT_EQ(encoded.size(), payload.size() + 65);
  EXPECT_TRUE(
      std::equal(std::begin(payload), std::end(payload), std::begin(encoded)));

  tx.signature = sentinel::schema::signature_t{
      sentinel::schema::secp256k1_signature_t{}};
  EXPECT_EQ(sentinel::schema::make_signing_payload(tx), payload);

  tx.nonce = 4;
  EXPECT_NE(sentinel::schema::make_signing_payload(tx), payload);
}

TEST(scale_encoding, audit_report_round_trips) {
  auto encoder = scale_encoder_t{};
  auto original = sentinel::schema::audit_report_t{
      .id = 9,
      .target_address = make_account(0x31),
      .auditor = make_account(0x02),
      .score = 100,
      .report_cid = std::string(120, 'q'),
      .critical_count = 0,
      .high_count = 0,
      .medium_count = 5,
      .low_count = 9,
      .published_at = 1'700'000'000'000};
  auto decoded = encoder.decode<sentinel::schema::audit_report_t>(
      sentinel::schema::make_bytes_view(encoder.encode(original)));
  EXPECT_EQ(decoded.id, 9u);
  EXPECT_EQ(decoded.auditor, original.auditor);
  EXPECT_EQ(decoded.report_cid, original.report_cid);
  EXPECT_EQ(decoded.medium_count, 5u);
  EXPECT_EQ(decoded.published_at, original.published_at);
}
