#pragma once
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/request_status.hpp>

// Schema type: audit request.
// Escrow workflow: one record per deposit. Only the request queue creates or
// mutates it; records are transitioned, never deleted.
namespace sentinel::schema {

template <uint16_t Version>
struct audit_request;

template <>
struct audit_request<1> final {
  uint16_t version{1};
  request_id_t id{};
  account_id_t requester{};
  account_id_t target_address{};
  amount_t payment{};
  request_status_t status{request_status_t::pending};
  timestamp_milliseconds_t requested_at{};
  // Zero until completed.
  timestamp_milliseconds_t completed_at{};
  // Zero until completed; opaque registry identifier supplied by the auditor.
  report_id_t report_id{};
};

using audit_request_t = audit_request<1>;

}  // namespace sentinel::schema
