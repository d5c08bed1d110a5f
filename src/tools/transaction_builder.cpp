#include <boost/program_options.hpp>
#include <sentinel/blake3/hash.hpp>
#include <sentinel/common/critical.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/transaction.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

template <std::size_t N>
std::array<uint8_t, N> get_fixed(const po::variables_map& vm,
                                 const std::string& name) {
  if (!vm.contains(name)) {
    sentinel::common::critical("missing required argument --" + name);
  }
  auto bytes = sentinel::schema::try_from_hex(vm[name].as<std::string>());
  if (!bytes || bytes->size() != N) {
    sentinel::common::critical("--" + name + " must be " + std::to_string(N) +
                               " bytes of hex");
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(*bytes), std::end(*bytes), std::begin(out));
  return out;
}

sentinel::schema::account_id_t get_account(const po::variables_map& vm,
                                           const std::string& name) {
  return get_fixed<20>(vm, name);
}

sentinel::schema::amount_t get_amount(const po::variables_map& vm,
                                      const std::string& name) {
  auto amount =
      sentinel::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    sentinel::common::critical("--" + name +
                               " must be a decimal amount below 2^256");
  }
  return *amount;
}

sentinel::schema::signer_id_t make_signer(const po::variables_map& vm) {
  if (vm.contains("ed25519-public-key")) {
    return sentinel::schema::ed25519_signer_id{
        .public_key = get_fixed<32>(vm, "ed25519-public-key")};
  }
  if (vm.contains("secp256k1-public-key")) {
    return sentinel::schema::secp256k1_signer_id{
        .public_key = get_fixed<33>(vm, "secp256k1-public-key")};
  }
  return sentinel::schema::signer_id_t{get_account(vm, "signer")};
}

sentinel::schema::signature_t make_signature(const po::variables_map& vm) {
  auto kind = vm["signature-kind"].as<std::string>();
  auto hex = vm["signature-hex"].as<std::string>();
  auto bytes = hex.empty() ? sentinel::schema::bytes_t{}
                           : sentinel::schema::from_hex(hex);
  if (kind == "ed25519") {
    auto signature = sentinel::schema::ed25519_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        sentinel::common::critical("ed25519 signature must be 64 bytes");
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return sentinel::schema::signature_t{signature};
  }
  if (kind == "secp256k1") {
    auto signature = sentinel::schema::secp256k1_signature_t{};
    if (!bytes.empty()) {
      if (bytes.size() != signature.size()) {
        sentinel::common::critical("secp256k1 signature must be 65 bytes");
      }
      std::copy(std::begin(bytes), std::end(bytes), std::begin(signature));
    }
    return sentinel::schema::signature_t{signature};
  }
  sentinel::common::critical("unsupported signature-kind");
}

uint32_t get_count(const po::variables_map& vm, const std::string& name) {
  return vm[name].as<uint32_t>();
}

sentinel::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "submit_request") {
    return sentinel::schema::submit_request_t{
        .target_address = get_account(vm, "target"),
        .deposit = get_amount(vm, "amount")};
  }
  if (payload == "start_work") {
    return sentinel::schema::start_work_t{
        .request_id = vm["request-id"].as<uint64_t>()};
  }
  if (payload == "complete_work") {
    return sentinel::schema::complete_work_t{
        .request_id = vm["request-id"].as<uint64_t>(),
        .report_id = vm["report-id"].as<uint64_t>()};
  }
  if (payload == "refund_request") {
    return sentinel::schema::refund_request_t{
        .request_id = vm["request-id"].as<uint64_t>()};
  }
  if (payload == "set_minimum_fee") {
    return sentinel::schema::set_minimum_fee_t{
        .minimum_fee = get_amount(vm, "amount")};
  }
  if (payload == "set_refund_timeout") {
    return sentinel::schema::set_refund_timeout_t{
        .refund_timeout = vm["timeout-ms"].as<uint64_t>()};
  }
  if (payload == "set_auditor") {
    return sentinel::schema::set_auditor_t{
        .auditor = get_account(vm, "auditor")};
  }
  if (payload == "grant_fee_exemption") {
    return sentinel::schema::grant_fee_exemption_t{
        .target_address = get_account(vm, "target")};
  }
  if (payload == "withdraw_funds") {
    return sentinel::schema::withdraw_funds_t{
        .recipient = get_account(vm, "recipient")};
  }
  if (payload == "set_paused") {
    return sentinel::schema::set_paused_t{.paused = vm["paused"].as<bool>()};
  }
  if (payload == "transfer_ownership") {
    return sentinel::schema::transfer_ownership_t{
        .new_owner = get_account(vm, "new-owner")};
  }
  if (payload == "transfer") {
    return sentinel::schema::transfer_t{
        .recipient = get_account(vm, "recipient"),
        .amount = get_amount(vm, "amount")};
  }
  if (payload == "publish_report") {
    auto score = vm["score"].as<uint32_t>();
    if (score > 255) {
      sentinel::common::critical("--score must fit in one byte");
    }
    return sentinel::schema::publish_report_t{
        .target_address = get_account(vm, "target"),
        .score = static_cast<uint8_t>(score),
        .report_cid = vm["report-cid"].as<std::string>(),
        .critical_count = get_count(vm, "critical-count"),
        .high_count = get_count(vm, "high-count"),
        .medium_count = get_count(vm, "medium-count"),
        .low_count = get_count(vm, "low-count")};
  }
  if (payload == "register_auditor") {
    return sentinel::schema::register_auditor_t{
        .auditor = get_account(vm, "auditor"),
        .name = vm["auditor-name"].as<std::string>()};
  }
  if (payload == "revoke_auditor") {
    return sentinel::schema::revoke_auditor_t{
        .auditor = get_account(vm, "auditor")};
  }
  sentinel::common::critical("unsupported payload type");
}

sentinel::schema::bytes_t build_query_data(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/queue/pending" ||
      path == "/queue/balance" || path == "/queue/config" ||
      path == "/registry/count" || path == "/registry/disclaimer") {
    return {};
  }
  if (path == "/engine/nonce" || path == "/account/balance" ||
      path == "/queue/by_requester") {
    return encoder.encode(get_account(vm, "account"));
  }
  if (path == "/queue/fee_exempt" || path == "/registry/by_target") {
    return encoder.encode(get_account(vm, "target"));
  }
  if (path == "/registry/auditor") {
    return encoder.encode(get_account(vm, "auditor"));
  }
  if (path == "/queue/request") {
    return encoder.encode(vm["request-id"].as<uint64_t>());
  }
  if (path == "/registry/report") {
    return encoder.encode(vm["report-id"].as<uint64_t>());
  }
  sentinel::common::critical("unsupported query path");
}

sentinel::schema::transaction_t build_transaction(
    const po::variables_map& vm) {
  if (!vm.contains("payload")) {
    sentinel::common::critical("transaction mode requires --payload");
  }
  return sentinel::schema::transaction_t{
      .version = 1,
      .chain_id = get_fixed<32>(vm, "chain-id"),
      .nonce = vm["nonce"].as<uint64_t>(),
      .signer = make_signer(vm),
      .payload = build_payload(vm),
      .signature = make_signature(vm)};
}

void print_bytes(const sentinel::schema::bytes_t& bytes,
                 const std::string& format) {
  if (format == "hex") {
    std::cout << sentinel::schema::to_hex(bytes) << '\n';
    return;
  }
  if (format == "base64") {
    std::cout << sentinel::schema::to_base64(bytes) << '\n';
    return;
  }
  sentinel::common::critical("format must be hex|base64");
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction [options]\n"
            << "  transaction_builder signing-payload [options]\n"
            << "  transaction_builder query-data [options]\n"
            << "  transaction_builder chain-id [--chain-name name]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto format = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|signing-payload|query-data|chain-id")(
      "format", po::value<std::string>(&format)->default_value("base64"),
      "hex|base64")("payload", po::value<std::string>(),
                    "transaction payload type")(
      "path", po::value<std::string>(), "abci query path")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "chain-name", po::value<std::string>()->default_value("sentinel-local"),
      "chain name hashed by chain-id")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "signer", po::value<std::string>(), "named signer account hex")(
      "ed25519-public-key", po::value<std::string>(),
      "ed25519 signer public key hex")("secp256k1-public-key",
                                       po::value<std::string>(),
                                       "compressed secp256k1 public key hex")(
      "signature-kind", po::value<std::string>()->default_value("ed25519"),
      "ed25519|secp256k1")("signature-hex",
                           po::value<std::string>()->default_value(""),
                           "signature bytes hex")(
      "account", po::value<std::string>(), "account hex")(
      "target", po::value<std::string>(), "audit target account hex")(
      "auditor", po::value<std::string>(), "auditor account hex")(
      "recipient", po::value<std::string>(), "recipient account hex")(
      "new-owner", po::value<std::string>(), "new owner account hex")(
      "amount", po::value<std::string>()->default_value("0"),
      "decimal amount in base units")(
      "request-id", po::value<uint64_t>()->default_value(0), "request id")(
      "report-id", po::value<uint64_t>()->default_value(0), "report id")(
      "timeout-ms", po::value<uint64_t>()->default_value(0),
      "refund timeout ms")("paused", po::value<bool>()->default_value(true),
                           "pause flag")(
      "score", po::value<uint32_t>()->default_value(0), "report score")(
      "report-cid", po::value<std::string>()->default_value(""),
      "content identifier of the full report")(
      "critical-count", po::value<uint32_t>()->default_value(0),
      "critical issue count")("high-count",
                              po::value<uint32_t>()->default_value(0),
                              "high issue count")(
      "medium-count", po::value<uint32_t>()->default_value(0),
      "medium issue count")("low-count",
                            po::value<uint32_t>()->default_value(0),
                            "low issue count")(
      "auditor-name", po::value<std::string>()->default_value(""),
      "auditor display name");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    print_bytes(encoder_t{}.encode(build_transaction(vm)), format);
    return 0;
  }

  if (command == "signing-payload") {
    print_bytes(sentinel::schema::make_signing_payload(build_transaction(vm)),
                format);
    return 0;
  }

  if (command == "query-data") {
    if (!vm.contains("path")) {
      sentinel::common::critical("query-data mode requires --path");
    }
    print_bytes(build_query_data(vm), format);
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id =
        sentinel::blake3::hash(vm["chain-name"].as<std::string>());
    std::cout << sentinel::schema::to_hex(chain_id) << '\n';
    return 0;
  }

  sentinel::common::critical(
      "command must be transaction|signing-payload|query-data|chain-id");
}
