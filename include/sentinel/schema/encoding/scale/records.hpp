#pragma once
#include <sentinel/schema/audit_report.hpp>
#include <sentinel/schema/audit_request.hpp>
#include <sentinel/schema/auditor_record.hpp>
#include <sentinel/schema/queue_state.hpp>
#include <sentinel/schema/registry_state.hpp>
#include <sentinel/schema/request_status.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sentinel::schema {

void encode(const request_status_t& o, ::scale::Encoder& encoder);
void decode(request_status_t& o, ::scale::Decoder& decoder);

void encode(const audit_request<1>& o, ::scale::Encoder& encoder);
void decode(audit_request<1>& o, ::scale::Decoder& decoder);

void encode(const queue_state<1>& o, ::scale::Encoder& encoder);
void decode(queue_state<1>& o, ::scale::Decoder& decoder);

void encode(const audit_report<1>& o, ::scale::Encoder& encoder);
void decode(audit_report<1>& o, ::scale::Decoder& decoder);

void encode(const auditor_record<1>& o, ::scale::Encoder& encoder);
void decode(auditor_record<1>& o, ::scale::Decoder& decoder);

void encode(const registry_state<1>& o, ::scale::Encoder& encoder);
void decode(registry_state<1>& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
