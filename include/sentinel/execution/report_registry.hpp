#pragma once

#include <sentinel/execution/state_view.hpp>
#include <sentinel/schema/audit_report.hpp>
#include <sentinel/schema/auditor_record.hpp>
#include <sentinel/schema/publish_report.hpp>
#include <sentinel/schema/register_auditor.hpp>
#include <sentinel/schema/registry_state.hpp>
#include <sentinel/schema/revoke_auditor.hpp>
#include <sentinel/schema/transaction_result.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace sentinel::execution {

/// Append-only audit report store with an owner-managed auditor list.
///
/// Reports get sequential ids from 1 and are never modified. The queue uses
/// the ids as opaque tokens and never calls into the registry.
class report_registry final {
 public:
  explicit report_registry(state_view& state);

  void initialize(const sentinel::schema::account_id_t& owner,
                  sentinel::schema::duration_milliseconds_t report_cooldown);
  std::optional<sentinel::schema::registry_state_t> load_state() const;

  sentinel::schema::transaction_result_t publish_report(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::publish_report_t& operation,
      sentinel::schema::timestamp_milliseconds_t now);
  sentinel::schema::transaction_result_t register_auditor(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::register_auditor_t& operation);
  sentinel::schema::transaction_result_t revoke_auditor(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::revoke_auditor_t& operation);
  sentinel::schema::transaction_result_t transfer_ownership(
      const sentinel::schema::account_id_t& caller,
      const sentinel::schema::account_id_t& new_owner);

  std::optional<sentinel::schema::audit_report_t> get_report(
      sentinel::schema::report_id_t report_id) const;
  std::vector<sentinel::schema::report_id_t> list_reports_for_target(
      const sentinel::schema::account_id_t& target) const;
  std::optional<sentinel::schema::auditor_record_t> get_auditor(
      const sentinel::schema::account_id_t& auditor) const;

  /// Number of reports ever published. Repeat audits of one target count
  /// once per report.
  sentinel::schema::report_id_t audited_contracts_count() const;

  static std::string_view disclaimer();

 private:
  sentinel::schema::registry_state_t require_state() const;

  state_view& state_;
};

}  // namespace sentinel::execution
