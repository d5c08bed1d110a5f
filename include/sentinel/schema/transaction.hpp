#pragma once
#include <sentinel/schema/complete_work.hpp>
#include <sentinel/schema/grant_fee_exemption.hpp>
#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/publish_report.hpp>
#include <sentinel/schema/refund_request.hpp>
#include <sentinel/schema/register_auditor.hpp>
#include <sentinel/schema/revoke_auditor.hpp>
#include <sentinel/schema/set_auditor.hpp>
#include <sentinel/schema/set_minimum_fee.hpp>
#include <sentinel/schema/set_paused.hpp>
#include <sentinel/schema/set_refund_timeout.hpp>
#include <sentinel/schema/start_work.hpp>
#include <sentinel/schema/submit_request.hpp>
#include <sentinel/schema/transfer.hpp>
#include <sentinel/schema/transfer_ownership.hpp>
#include <sentinel/schema/withdraw_funds.hpp>
#include <variant>

namespace sentinel::schema {

// Alternative order is part of the wire format.
using transaction_payload_t = std::variant<submit_request_t,
                                           start_work_t,
                                           complete_work_t,
                                           refund_request_t,
                                           set_minimum_fee_t,
                                           set_refund_timeout_t,
                                           set_auditor_t,
                                           grant_fee_exemption_t,
                                           withdraw_funds_t,
                                           set_paused_t,
                                           transfer_ownership_t,
                                           transfer_t,
                                           publish_report_t,
                                           register_auditor_t,
                                           revoke_auditor_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  signer_id_t signer{};
  transaction_payload_t payload{};
  signature_t signature;
};

using transaction_t = transaction<1>;

}  // namespace sentinel::schema
