#pragma once
#include <sentinel/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sentinel::schema {

void encode(const submit_request<1>& o, ::scale::Encoder& encoder);
void decode(submit_request<1>& o, ::scale::Decoder& decoder);

void encode(const start_work<1>& o, ::scale::Encoder& encoder);
void decode(start_work<1>& o, ::scale::Decoder& decoder);

void encode(const complete_work<1>& o, ::scale::Encoder& encoder);
void decode(complete_work<1>& o, ::scale::Decoder& decoder);

void encode(const refund_request<1>& o, ::scale::Encoder& encoder);
void decode(refund_request<1>& o, ::scale::Decoder& decoder);

void encode(const set_minimum_fee<1>& o, ::scale::Encoder& encoder);
void decode(set_minimum_fee<1>& o, ::scale::Decoder& decoder);

void encode(const set_refund_timeout<1>& o, ::scale::Encoder& encoder);
void decode(set_refund_timeout<1>& o, ::scale::Decoder& decoder);

void encode(const set_auditor<1>& o, ::scale::Encoder& encoder);
void decode(set_auditor<1>& o, ::scale::Decoder& decoder);

void encode(const grant_fee_exemption<1>& o, ::scale::Encoder& encoder);
void decode(grant_fee_exemption<1>& o, ::scale::Decoder& decoder);

void encode(const withdraw_funds<1>& o, ::scale::Encoder& encoder);
void decode(withdraw_funds<1>& o, ::scale::Decoder& decoder);

void encode(const set_paused<1>& o, ::scale::Encoder& encoder);
void decode(set_paused<1>& o, ::scale::Decoder& decoder);

void encode(const transfer_ownership<1>& o, ::scale::Encoder& encoder);
void decode(transfer_ownership<1>& o, ::scale::Decoder& decoder);

void encode(const transfer<1>& o, ::scale::Encoder& encoder);
void decode(transfer<1>& o, ::scale::Decoder& decoder);

void encode(const publish_report<1>& o, ::scale::Encoder& encoder);
void decode(publish_report<1>& o, ::scale::Decoder& decoder);

void encode(const register_auditor<1>& o, ::scale::Encoder& encoder);
void decode(register_auditor<1>& o, ::scale::Decoder& decoder);

void encode(const revoke_auditor<1>& o, ::scale::Encoder& encoder);
void decode(revoke_auditor<1>& o, ::scale::Decoder& decoder);

void encode(const transaction<1>& o, ::scale::Encoder& encoder);
void decode(transaction<1>& o, ::scale::Decoder& decoder);

/// Bytes covered by the transaction signature: every field except the
/// signature itself.
bytes_t make_signing_payload(const transaction<1>& o);

}  // namespace sentinel::schema
