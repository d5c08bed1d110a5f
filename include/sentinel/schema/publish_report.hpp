#pragma once
#include <sentinel/schema/primitives.hpp>
#include <string>
// Schema type: publish report.
// Registry workflow: authorized auditor appends a report for a target.
namespace sentinel::schema {

template <uint16_t Version>
struct publish_report;

template <>
struct publish_report<1> final {
  uint16_t version{1};
  account_id_t target_address{};
  uint8_t score{};
  std::string report_cid;
  uint32_t critical_count{};
  uint32_t high_count{};
  uint32_t medium_count{};
  uint32_t low_count{};
};

using publish_report_t = publish_report<1>;

}  // namespace sentinel::schema
