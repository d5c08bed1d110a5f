#pragma once

#include <gtest/gtest.h>

#include <sentinel/execution/engine.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/genesis.hpp>
#include <sentinel/schema/transaction.hpp>
#include <sentinel/schema/transaction_error_code.hpp>
#include <sentinel/testing/common.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel::testing {

using scale_encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;

inline constexpr auto kTestChainName = std::string_view{"sentinel-test"};

// Well known test identities.
inline const auto kOwner = make_account(0x01);
inline const auto kAuditor = make_account(0x02);
inline const auto kRequester = make_account(0x10);
inline const auto kOtherRequester = make_account(0x11);
inline const auto kStranger = make_account(0x20);
inline const auto kTarget = make_account(0x30);
inline const auto kOtherTarget = make_account(0x31);

inline sentinel::schema::genesis_t make_genesis() {
  auto genesis = sentinel::schema::genesis_t{};
  genesis.chain_id = std::string{kTestChainName};
  genesis.owner = kOwner;
  genesis.auditor = kAuditor;
  genesis.balances = {{kRequester, tokens(100)},
                      {kOtherRequester, tokens(100)},
                      {kStranger, tokens(1)}};
  return genesis;
}

inline sentinel::schema::transaction_t make_transaction(
    const sentinel::schema::hash32_t& chain_id,
    const uint64_t nonce,
    const sentinel::schema::signer_id_t& signer,
    const sentinel::schema::transaction_payload_t& payload) {
  return sentinel::schema::transaction_t{
      .version = 1,
      .chain_id = chain_id,
      .nonce = nonce,
      .signer = signer,
      .payload = payload,
      .signature = sentinel::schema::ed25519_signature_t{}};
}

inline sentinel::schema::bytes_t encode_transaction(
    const sentinel::schema::transaction_t& tx) {
  auto encoder = scale_encoder_t{};
  return encoder.encode(tx);
}

inline bool has_event(const sentinel::schema::transaction_result_t& result,
                      const std::string_view type) {
  return std::ranges::any_of(result.events, [&](const auto& event) {
    return event.type == type;
  });
}

inline std::optional<std::string> event_attribute(
    const sentinel::schema::transaction_result_t& result,
    const std::string_view type,
    const std::string_view key) {
  for (const auto& event : result.events) {
    if (event.type != type) {
      continue;
    }
    for (const auto& attribute : event.attributes) {
      if (attribute.key == key) {
        return attribute.value;
      }
    }
  }
  return std::nullopt;
}

inline uint32_t code_of(const sentinel::schema::transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace sentinel::testing
