#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/encoding/scale/primitives.hpp>
#include <sentinel/schema/encoding/scale/transaction.hpp>

namespace sentinel::schema {

void encode(const submit_request<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.target_address, encoder);
  encode_amount(o.deposit, encoder);
}

void decode(submit_request<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.target_address, decoder);
  decode_amount(o.deposit, decoder);
}

void encode(const start_work<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.request_id, encoder);
}

void decode(start_work<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.request_id, decoder);
}

void encode(const complete_work<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.request_id, encoder);
  encode(o.report_id, encoder);
}

void decode(complete_work<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.request_id, decoder);
  decode(o.report_id, decoder);
}

void encode(const refund_request<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.request_id, encoder);
}

void decode(refund_request<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.request_id, decoder);
}

void encode(const set_minimum_fee<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode_amount(o.minimum_fee, encoder);
}

void decode(set_minimum_fee<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode_amount(o.minimum_fee, decoder);
}

void encode(const set_refund_timeout<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.refund_timeout, encoder);
}

void decode(set_refund_timeout<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.refund_timeout, decoder);
}

void encode(const set_auditor<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.auditor, encoder);
}

void decode(set_auditor<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.auditor, decoder);
}

void encode(const grant_fee_exemption<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.target_address, encoder);
}

void decode(grant_fee_exemption<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.target_address, decoder);
}

void encode(const withdraw_funds<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.recipient, encoder);
}

void decode(withdraw_funds<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.recipient, decoder);
}

void encode(const set_paused<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.paused, encoder);
}

void decode(set_paused<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.paused, decoder);
}

void encode(const transfer_ownership<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.new_owner, encoder);
}

void decode(transfer_ownership<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.new_owner, decoder);
}

void encode(const transfer<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.recipient, encoder);
  encode_amount(o.amount, encoder);
}

void decode(transfer<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.recipient, decoder);
  decode_amount(o.amount, decoder);
}

void encode(const publish_report<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.target_address, encoder);
  encode(o.score, encoder);
  encode(o.report_cid, encoder);
  encode(o.critical_count, encoder);
  encode(o.high_count, encoder);
  encode(o.medium_count, encoder);
  encode(o.low_count, encoder);
}

void decode(publish_report<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.target_address, decoder);
  decode(o.score, decoder);
  decode(o.report_cid, decoder);
  decode(o.critical_count, decoder);
  decode(o.high_count, decoder);
  decode(o.medium_count, decoder);
  decode(o.low_count, decoder);
}

void encode(const register_auditor<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.auditor, encoder);
  encode(o.name, encoder);
}

void decode(register_auditor<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.auditor, decoder);
  decode(o.name, decoder);
}

void encode(const revoke_auditor<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.auditor, encoder);
}

void decode(revoke_auditor<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.auditor, decoder);
}

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.nonce, encoder);
  encode(o.signer, encoder);
  encode(o.payload, encoder);
  encode(o.signature, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.nonce, decoder);
  decode(o.signer, decoder);
  decode(o.payload, decoder);
  decode(o.signature, decoder);
}

bytes_t make_signing_payload(const transaction<1>& o) {
  auto codec = encoding::encoder<encoding::scale_encoder_tag>{};
  auto payload = bytes_t{};
  codec.encode(o.version, payload);
  codec.encode(o.chain_id, payload);
  codec.encode(o.nonce, payload);
  codec.encode(o.signer, payload);
  codec.encode(o.payload, payload);
  return payload;
}

}  // namespace sentinel::schema
