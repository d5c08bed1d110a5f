#include <sentinel/schema/key/builder.hpp>
#include <sentinel/schema/key/engine_keys.hpp>

namespace sentinel::schema::key {

namespace {

bytes_t make_account_key(const std::string_view prefix,
                         const account_id_t& account) {
  auto b = builder{};
  b.write(prefix).write(account);
  return b.data;
}

bytes_t make_id_key(const std::string_view prefix, const uint64_t id) {
  auto b = builder{};
  b.write(prefix).write(id);
  return b.data;
}

}  // namespace

bytes_t make_nonce_key(const account_id_t& account) {
  return make_account_key(kNonceKeyPrefix, account);
}

bytes_t make_balance_key(const account_id_t& account) {
  return make_account_key(kBalanceKeyPrefix, account);
}

bytes_t make_request_key(const request_id_t request_id) {
  return make_id_key(kRequestKeyPrefix, request_id);
}

bytes_t make_requester_index_prefix(const account_id_t& requester) {
  auto b = builder{};
  b.write(kRequesterIndexKeyPrefix).write(requester).write("|");
  return b.data;
}

bytes_t make_requester_index_key(const account_id_t& requester,
                                 const request_id_t request_id) {
  auto b = builder{.data = make_requester_index_prefix(requester)};
  b.write(request_id);
  return b.data;
}

bytes_t make_fee_exempt_key(const account_id_t& target) {
  return make_account_key(kFeeExemptKeyPrefix, target);
}

bytes_t make_queue_config_key() {
  return make_bytes(kQueueConfigKey);
}

bytes_t make_report_key(const report_id_t report_id) {
  return make_id_key(kReportKeyPrefix, report_id);
}

bytes_t make_target_reports_prefix(const account_id_t& target) {
  auto b = builder{};
  b.write(kTargetReportsKeyPrefix).write(target).write("|");
  return b.data;
}

bytes_t make_target_reports_key(const account_id_t& target,
                                const report_id_t report_id) {
  auto b = builder{.data = make_target_reports_prefix(target)};
  b.write(report_id);
  return b.data;
}

bytes_t make_auditor_key(const account_id_t& auditor) {
  return make_account_key(kAuditorKeyPrefix, auditor);
}

bytes_t make_registry_config_key() {
  return make_bytes(kRegistryConfigKey);
}

bytes_t make_last_publish_key(const account_id_t& auditor) {
  return make_account_key(kLastPublishKeyPrefix, auditor);
}

bytes_t make_chain_id_key() {
  return make_bytes(kChainIdKey);
}

bytes_t make_committed_state_key() {
  return make_bytes(kCommittedStateKey);
}

std::optional<uint64_t> parse_index_suffix(const bytes_view_t& key) {
  if (key.size() < sizeof(uint64_t)) {
    return std::nullopt;
  }
  return read_integral<uint64_t>(key, key.size() - sizeof(uint64_t));
}

}  // namespace sentinel::schema::key
