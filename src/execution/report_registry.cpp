#include <spdlog/spdlog.h>
#include <sentinel/common/critical.hpp>
#include <sentinel/execution/report_registry.hpp>
#include <sentinel/execution/result.hpp>
#include <sentinel/schema/key/engine_keys.hpp>

using namespace sentinel::schema;

namespace sentinel::execution {

namespace {

constexpr auto kDisclaimer = std::string_view{
    "Audit reports are point-in-time assessments produced by automated and "
    "manual review. A report does not guarantee the absence of "
    "vulnerabilities, is not financial advice, and does not endorse the "
    "audited contract. Verify the referenced report content independently."};

transaction_result_t unauthorized(const std::string_view info) {
  return make_error_result(transaction_error_code::unauthorized,
                           kCodespaceRegistry, "unauthorized",
                           std::string{info});
}

}  // namespace

report_registry::report_registry(state_view& state) : state_(state) {}

void report_registry::initialize(const account_id_t& owner,
                                 const duration_milliseconds_t report_cooldown) {
  state_.put(key::make_registry_config_key(),
             registry_state_t{.owner = owner,
                              .report_count = 0,
                              .report_cooldown = report_cooldown});
}

std::optional<registry_state_t> report_registry::load_state() const {
  return state_.get<registry_state_t>(key::make_registry_config_key());
}

registry_state_t report_registry::require_state() const {
  auto state = load_state();
  if (!state) {
    sentinel::common::critical("registry state missing after genesis");
  }
  return *state;
}

transaction_result_t report_registry::publish_report(
    const account_id_t& caller,
    const publish_report_t& operation,
    const timestamp_milliseconds_t now) {
  auto auditor = get_auditor(caller);
  if (!auditor || !auditor->authorized) {
    return unauthorized("caller is not an authorized auditor");
  }
  if (is_null_account(operation.target_address)) {
    return make_error_result(transaction_error_code::invalid_input,
                             kCodespaceRegistry, "invalid input",
                             "target address must be non-null");
  }
  if (operation.report_cid.empty()) {
    return make_error_result(transaction_error_code::invalid_input,
                             kCodespaceRegistry, "invalid input",
                             "report cid must be non-empty");
  }
  if (operation.score > kMaxReportScore) {
    return make_error_result(transaction_error_code::invalid_report,
                             kCodespaceRegistry, "invalid report",
                             "score exceeds 100");
  }
  for (const auto count : {operation.critical_count, operation.high_count,
                           operation.medium_count, operation.low_count}) {
    if (count > kMaxIssueCount) {
      return make_error_result(transaction_error_code::invalid_report,
                               kCodespaceRegistry, "invalid report",
                               "issue count exceeds 10000");
    }
  }

  auto registry = require_state();
  auto last_publish_key = key::make_last_publish_key(caller);
  if (auto last = state_.get<timestamp_milliseconds_t>(last_publish_key)) {
    if (now < *last || now - *last < registry.report_cooldown) {
      return make_error_result(
          transaction_error_code::report_cooldown_active, kCodespaceRegistry,
          "report cooldown active",
          "last publication at " + std::to_string(*last));
    }
  }

  auto report = audit_report_t{.id = registry.report_count + 1,
                               .target_address = operation.target_address,
                               .auditor = caller,
                               .score = operation.score,
                               .report_cid = operation.report_cid,
                               .critical_count = operation.critical_count,
                               .high_count = operation.high_count,
                               .medium_count = operation.medium_count,
                               .low_count = operation.low_count,
                               .published_at = now};
  registry.report_count = report.id;

  state_.put(key::make_report_key(report.id), report);
  state_.put(key::make_target_reports_key(report.target_address, report.id),
             report.id);
  state_.put(last_publish_key, now);
  state_.put(key::make_registry_config_key(), registry);

  auto encoder = state_view::encoder_t{};
  auto result = transaction_result_t{};
  result.data = encoder.encode(report.id);
  result.events.push_back(make_event(
      "report_published", {{"report_id", to_event_value(report.id)},
                           {"target", to_event_value(report.target_address)},
                           {"auditor", to_event_value(caller)},
                           {"score", to_event_value(report.score)},
                           {"report_cid", report.report_cid}}));
  spdlog::debug("Published report {} for target {}", report.id,
                to_event_value(report.target_address));
  return result;
}

transaction_result_t report_registry::register_auditor(
    const account_id_t& caller,
    const register_auditor_t& operation) {
  if (caller != require_state().owner) {
    return unauthorized("caller is not the registry owner");
  }
  if (is_null_account(operation.auditor) || operation.name.empty()) {
    return make_error_result(transaction_error_code::invalid_input,
                             kCodespaceRegistry, "invalid input",
                             "auditor must be non-null with a name");
  }
  state_.put(key::make_auditor_key(operation.auditor),
             auditor_record_t{.auditor = operation.auditor,
                              .authorized = true,
                              .name = operation.name});

  auto result = transaction_result_t{};
  result.events.push_back(
      make_event("auditor_registered",
                 {{"auditor", to_event_value(operation.auditor)},
                  {"name", operation.name}}));
  return result;
}

transaction_result_t report_registry::revoke_auditor(
    const account_id_t& caller,
    const revoke_auditor_t& operation) {
  if (caller != require_state().owner) {
    return unauthorized("caller is not the registry owner");
  }
  auto record = get_auditor(operation.auditor);
  if (!record) {
    return make_error_result(transaction_error_code::not_found,
                             kCodespaceRegistry, "auditor not found",
                             "auditor was never registered");
  }
  record->authorized = false;
  state_.put(key::make_auditor_key(operation.auditor), *record);

  auto result = transaction_result_t{};
  result.events.push_back(make_event(
      "auditor_revoked", {{"auditor", to_event_value(operation.auditor)}}));
  return result;
}

transaction_result_t report_registry::transfer_ownership(
    const account_id_t& caller,
    const account_id_t& new_owner) {
  auto registry = require_state();
  if (caller != registry.owner) {
    return unauthorized("caller is not the registry owner");
  }
  if (is_null_account(new_owner)) {
    return make_error_result(transaction_error_code::invalid_input,
                             kCodespaceRegistry, "invalid input",
                             "new owner must be non-null");
  }
  registry.owner = new_owner;
  state_.put(key::make_registry_config_key(), registry);
  return transaction_result_t{};
}

std::optional<audit_report_t> report_registry::get_report(
    const report_id_t report_id) const {
  auto registry = load_state();
  if (!registry || report_id == 0 || report_id > registry->report_count) {
    return std::nullopt;
  }
  return state_.get<audit_report_t>(key::make_report_key(report_id));
}

std::vector<report_id_t> report_registry::list_reports_for_target(
    const account_id_t& target) const {
  auto prefix = key::make_target_reports_prefix(target);
  auto out = std::vector<report_id_t>{};
  for (const auto& entry :
       state_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto id = key::parse_index_suffix(
        bytes_view_t{entry.first.data(), entry.first.size()});
    if (!id) {
      sentinel::common::critical("malformed target report index key");
    }
    out.push_back(*id);
  }
  return out;
}

std::optional<auditor_record_t> report_registry::get_auditor(
    const account_id_t& auditor) const {
  return state_.get<auditor_record_t>(key::make_auditor_key(auditor));
}

report_id_t report_registry::audited_contracts_count() const {
  auto registry = load_state();
  return registry ? registry->report_count : 0;
}

std::string_view report_registry::disclaimer() {
  return kDisclaimer;
}

}  // namespace sentinel::execution
