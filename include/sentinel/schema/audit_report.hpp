#pragma once
#include <sentinel/schema/primitives.hpp>
#include <string>

// Schema type: audit report.
// Registry workflow: immutable record appended by an authorized auditor. The
// score and issue counts are produced off-chain and recorded as given.
namespace sentinel::schema {

template <uint16_t Version>
struct audit_report;

template <>
struct audit_report<1> final {
  uint16_t version{1};
  report_id_t id{};
  account_id_t target_address{};
  account_id_t auditor{};
  uint8_t score{};
  std::string report_cid;
  uint32_t critical_count{};
  uint32_t high_count{};
  uint32_t medium_count{};
  uint32_t low_count{};
  timestamp_milliseconds_t published_at{};
};

using audit_report_t = audit_report<1>;

}  // namespace sentinel::schema
