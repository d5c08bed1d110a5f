#pragma once

#include <sentinel/schema/primitives.hpp>
#include <sentinel/schema/transaction_error_code.hpp>
#include <sentinel/schema/transaction_event.hpp>
#include <sentinel/schema/transaction_result.hpp>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>

namespace sentinel::execution {

inline constexpr auto kCodespaceCheckTx = std::string_view{"sentinel.checktx"};
inline constexpr auto kCodespaceExecute = std::string_view{"sentinel.execute"};
inline constexpr auto kCodespaceQueue = std::string_view{"sentinel.queue"};
inline constexpr auto kCodespaceRegistry =
    std::string_view{"sentinel.registry"};
inline constexpr auto kCodespaceBank = std::string_view{"sentinel.bank"};

sentinel::schema::transaction_result_t make_error_result(
    sentinel::schema::transaction_error_code code,
    std::string_view codespace,
    std::string log,
    std::string info = {});

/// Ids and identities ("request_id", "report_id", "requester", "auditor",
/// "target") are marked for CometBFT indexing.
sentinel::schema::transaction_event_t make_event(
    std::string type,
    std::initializer_list<std::pair<std::string_view, std::string>> attributes);

std::string to_event_value(const sentinel::schema::account_id_t& account);
std::string to_event_value(const sentinel::schema::amount_t& amount);
std::string to_event_value(uint64_t value);

}  // namespace sentinel::execution
