#pragma once

#include <sentinel/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Canonical key layout. Everything the state machine owns lives under
// SYS|STATE| and is folded into the state root; SYS|APP| holds node
// bookkeeping.
namespace sentinel::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kRequestKeyPrefix{"SYS|STATE|REQUEST|"};
inline constexpr std::string_view kRequesterIndexKeyPrefix{
    "SYS|STATE|REQUESTER_INDEX|"};
inline constexpr std::string_view kFeeExemptKeyPrefix{"SYS|STATE|FEE_EXEMPT|"};
inline constexpr std::string_view kQueueConfigKey{"SYS|STATE|QUEUE|CONFIG"};
inline constexpr std::string_view kReportKeyPrefix{"SYS|STATE|REPORT|"};
inline constexpr std::string_view kTargetReportsKeyPrefix{
    "SYS|STATE|TARGET_REPORTS|"};
inline constexpr std::string_view kAuditorKeyPrefix{"SYS|STATE|AUDITOR|"};
inline constexpr std::string_view kRegistryConfigKey{
    "SYS|STATE|REGISTRY|CONFIG"};
inline constexpr std::string_view kLastPublishKeyPrefix{
    "SYS|STATE|LAST_PUBLISH|"};
inline constexpr std::string_view kChainIdKey{"SYS|STATE|CHAIN|ID"};
inline constexpr std::string_view kCommittedStateKey{"SYS|APP|COMMITTED"};

bytes_t make_nonce_key(const account_id_t& account);
bytes_t make_balance_key(const account_id_t& account);
bytes_t make_request_key(request_id_t request_id);
bytes_t make_requester_index_prefix(const account_id_t& requester);
bytes_t make_requester_index_key(const account_id_t& requester,
                                 request_id_t request_id);
bytes_t make_fee_exempt_key(const account_id_t& target);
bytes_t make_queue_config_key();
bytes_t make_report_key(report_id_t report_id);
bytes_t make_target_reports_prefix(const account_id_t& target);
bytes_t make_target_reports_key(const account_id_t& target,
                                report_id_t report_id);
bytes_t make_auditor_key(const account_id_t& auditor);
bytes_t make_registry_config_key();
bytes_t make_last_publish_key(const account_id_t& auditor);
bytes_t make_chain_id_key();
bytes_t make_committed_state_key();

/// Recover the trailing id of an index key built by
/// make_requester_index_key or make_target_reports_key.
std::optional<uint64_t> parse_index_suffix(const bytes_view_t& key);

}  // namespace sentinel::schema::key
