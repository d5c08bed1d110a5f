#include <sentinel/schema/encoding/scale/primitives.hpp>
#include <sentinel/schema/encoding/scale/records.hpp>
#include <stdexcept>

namespace sentinel::schema {

void encode(const request_status_t& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(request_status_t& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  auto raw = uint8_t{};
  decode(raw, decoder);
  if (raw > static_cast<uint8_t>(request_status_t::refunded)) {
    throw std::invalid_argument{"unknown request status"};
  }
  o = static_cast<request_status_t>(raw);
}

void encode(const audit_request<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.requester, encoder);
  encode(o.target_address, encoder);
  encode_amount(o.payment, encoder);
  encode(o.status, encoder);
  encode(o.requested_at, encoder);
  encode(o.completed_at, encoder);
  encode(o.report_id, encoder);
}

void decode(audit_request<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.requester, decoder);
  decode(o.target_address, decoder);
  decode_amount(o.payment, decoder);
  decode(o.status, decoder);
  decode(o.requested_at, decoder);
  decode(o.completed_at, decoder);
  decode(o.report_id, decoder);
}

void encode(const queue_state<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.auditor, encoder);
  encode_amount(o.minimum_fee, encoder);
  encode(o.refund_timeout, encoder);
  encode(o.paused, encoder);
  encode(o.request_count, encoder);
  encode_amount(o.total_fees_collected, encoder);
}

void decode(queue_state<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.auditor, decoder);
  decode_amount(o.minimum_fee, decoder);
  decode(o.refund_timeout, decoder);
  decode(o.paused, decoder);
  decode(o.request_count, decoder);
  decode_amount(o.total_fees_collected, decoder);
}

void encode(const audit_report<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.target_address, encoder);
  encode(o.auditor, encoder);
  encode(o.score, encoder);
  encode(o.report_cid, encoder);
  encode(o.critical_count, encoder);
  encode(o.high_count, encoder);
  encode(o.medium_count, encoder);
  encode(o.low_count, encoder);
  encode(o.published_at, encoder);
}

void decode(audit_report<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.target_address, decoder);
  decode(o.auditor, decoder);
  decode(o.score, decoder);
  decode(o.report_cid, decoder);
  decode(o.critical_count, decoder);
  decode(o.high_count, decoder);
  decode(o.medium_count, decoder);
  decode(o.low_count, decoder);
  decode(o.published_at, decoder);
}

void encode(const auditor_record<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.auditor, encoder);
  encode(o.authorized, encoder);
  encode(o.name, encoder);
}

void decode(auditor_record<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.auditor, decoder);
  decode(o.authorized, decoder);
  decode(o.name, decoder);
}

void encode(const registry_state<1>& o, ::scale::Encoder& encoder) {
  using ::scale::encode;
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.report_count, encoder);
  encode(o.report_cooldown, encoder);
}

void decode(registry_state<1>& o, ::scale::Decoder& decoder) {
  using ::scale::decode;
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.report_count, decoder);
  decode(o.report_cooldown, decoder);
}

}  // namespace sentinel::schema
