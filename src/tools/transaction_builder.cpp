#include <boost/program_options.hpp>
#include <notary/blake3/hash.hpp>
#include <notary/common/critical.hpp>
#include <notary/crypto/secp256k1.hpp>
#include <notary/crypto/verify.hpp>
#include <notary/execution/assertion_registry.hpp>
#include <notary/execution/signature_verifier.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

const std::string& get_string(const po::variables_map& vm,
                              const std::string& name) {
  if (!vm.contains(name)) {
    notary::common::critical("missing required argument --{}", name);
  }
  return vm[name].as<std::string>();
}

notary::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  auto hash = notary::schema::try_make_hash32(get_string(vm, name));
  if (!hash) {
    notary::common::critical("--{} must be 32 bytes of hex", name);
  }
  return *hash;
}

notary::schema::address_t get_address(const po::variables_map& vm,
                                      const std::string& name) {
  auto address = notary::schema::try_make_address(get_string(vm, name));
  if (!address) {
    notary::common::critical("--{} must be 20 bytes of hex", name);
  }
  return *address;
}

notary::schema::address_t get_optional_address(const po::variables_map& vm,
                                               const std::string& name) {
  if (!vm.contains(name)) {
    return notary::schema::make_zero_address();
  }
  return get_address(vm, name);
}

notary::schema::amount_t get_amount(const po::variables_map& vm,
                                    const std::string& name) {
  auto amount = notary::schema::try_parse_amount(get_string(vm, name));
  if (!amount) {
    notary::common::critical("--{} must be a decimal amount", name);
  }
  return *amount;
}

std::optional<notary::schema::private_key_t> get_optional_key(
    const po::variables_map& vm,
    const std::string& key_name,
    const std::string& seed_name) {
  if (vm.contains(key_name)) {
    auto bytes = notary::schema::try_from_hex(vm[key_name].as<std::string>());
    if (!bytes || bytes->size() != 32) {
      notary::common::critical("--{} must be 32 bytes of hex", key_name);
    }
    auto key = notary::schema::private_key_t{};
    std::copy(std::begin(*bytes), std::end(*bytes), std::begin(key));
    return key;
  }
  if (vm.contains(seed_name)) {
    return notary::crypto::private_key_from_seed(
        vm[seed_name].as<std::string>());
  }
  return std::nullopt;
}

notary::schema::private_key_t get_key(const po::variables_map& vm,
                                      const std::string& key_name,
                                      const std::string& seed_name) {
  auto key = get_optional_key(vm, key_name, seed_name);
  if (!key) {
    notary::common::critical("one of --{} or --{} is required", key_name,
                             seed_name);
  }
  return *key;
}

notary::schema::address_t address_of(const notary::schema::private_key_t& key) {
  auto address = notary::crypto::address_from_private_key(key);
  if (!address) {
    notary::common::critical("private key is not a valid secp256k1 scalar");
  }
  return *address;
}

notary::crypto::domain_t make_domain(const po::variables_map& vm) {
  return notary::crypto::domain_t{
      .chain_id = get_hash32(vm, "chain-id"),
      .verifying_address = get_address(vm, "registry-address")};
}

notary::schema::assertion_id_t get_assertion_id(const po::variables_map& vm) {
  if (vm.contains("assertion-id")) {
    return get_hash32(vm, "assertion-id");
  }
  return notary::execution::assertion_registry::assertion_id_of(
      get_string(vm, "text"));
}

// Subject, timestamp and signature of an attest/revoke payload. Signs with
// --subject-key/--subject-seed when no --signature is given.
std::tuple<notary::schema::address_t,
           notary::schema::timestamp_seconds_t,
           notary::schema::signature_t>
make_subject_signature(const po::variables_map& vm, bool revoking) {
  auto signed_at = vm["signed-at"].as<uint64_t>();
  if (vm.contains("signature")) {
    auto signature = notary::schema::try_from_hex(get_string(vm, "signature"));
    auto parsed = signature
                      ? notary::schema::try_make_signature(
                            notary::schema::make_bytes_view(*signature))
                      : std::nullopt;
    if (!parsed) {
      notary::common::critical("--signature must be 65 bytes of hex");
    }
    return {get_address(vm, "subject"), signed_at, *parsed};
  }
  auto key = get_key(vm, "subject-key", "subject-seed");
  auto text = get_string(vm, "text");
  auto message = revoking ? notary::crypto::revocation_text(text) : text;
  auto signature = notary::crypto::sign_attestation(make_domain(vm), message,
                                                    signed_at, key);
  if (!signature) {
    notary::common::critical("failed to sign attestation message");
  }
  return {address_of(key), signed_at, *signature};
}

notary::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = get_string(vm, "payload");
  if (payload == "add_assertion") {
    return notary::schema::add_assertion_t{
        .text = get_string(vm, "text"),
        .freshness_window = vm["freshness"].as<uint64_t>(),
        .expiry_window = vm["expiry"].as<uint64_t>(),
        .requires_gateway = vm["requires-gateway"].as<bool>(),
        .gateway = get_optional_address(vm, "gateway"),
        .controller = get_optional_address(vm, "controller")};
  }
  if (payload == "set_controller") {
    return notary::schema::set_controller_t{
        .assertion_id = get_assertion_id(vm),
        .controller = get_address(vm, "controller")};
  }
  if (payload == "set_gateway") {
    return notary::schema::set_gateway_t{
        .assertion_id = get_assertion_id(vm),
        .gateway = get_address(vm, "gateway")};
  }
  if (payload == "stop_assertion") {
    return notary::schema::stop_assertion_t{.assertion_id =
                                                get_assertion_id(vm)};
  }
  if (payload == "unstop_assertion") {
    return notary::schema::unstop_assertion_t{.assertion_id =
                                                  get_assertion_id(vm)};
  }
  if (payload == "attest" || payload == "revoke") {
    auto assertion_id = get_assertion_id(vm);
    auto [subject, signed_at, signature] =
        make_subject_signature(vm, payload == "revoke");
    if (payload == "attest") {
      return notary::schema::attest_t{.assertion_id = assertion_id,
                                      .subject = subject,
                                      .signed_at = signed_at,
                                      .signature = signature};
    }
    return notary::schema::revoke_t{.assertion_id = assertion_id,
                                    .subject = subject,
                                    .signed_at = signed_at,
                                    .signature = signature};
  }
  if (payload == "force_attest") {
    return notary::schema::force_attest_t{
        .assertion_id = get_assertion_id(vm),
        .subject = get_address(vm, "subject"),
        .signed_at = vm["signed-at"].as<uint64_t>()};
  }
  if (payload == "force_revoke") {
    return notary::schema::force_revoke_t{
        .assertion_id = get_assertion_id(vm),
        .subject = get_address(vm, "subject")};
  }
  if (payload == "block_address") {
    return notary::schema::block_address_t{.address =
                                               get_address(vm, "address")};
  }
  if (payload == "unblock_address") {
    return notary::schema::unblock_address_t{.address =
                                                 get_address(vm, "address")};
  }
  if (payload == "set_tip_amount") {
    return notary::schema::set_tip_amount_t{.tip_amount =
                                                get_amount(vm, "amount")};
  }
  if (payload == "tip_out") {
    return notary::schema::tip_out_t{};
  }
  if (payload == "deposit") {
    return notary::schema::deposit_t{};
  }
  if (payload == "set_overrider") {
    return notary::schema::set_overrider_t{.overrider =
                                               get_address(vm, "address")};
  }
  if (payload == "set_tip_jar") {
    return notary::schema::set_tip_jar_t{.tip_jar = get_address(vm, "address")};
  }
  if (payload == "transfer_ownership") {
    return notary::schema::transfer_ownership_t{.new_owner =
                                                    get_address(vm, "address")};
  }
  if (payload == "renounce_ownership") {
    return notary::schema::renounce_ownership_t{};
  }
  notary::common::critical("unsupported payload type '{}'", payload);
}

notary::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = get_string(vm, "path");
  if (path == "/engine/info" || path == "/roles" || path == "/tips/balance" ||
      path == "/assertion/list_state") {
    return {};
  }
  if (path == "/assertion/get" || path == "/assertion/is_stopped") {
    return encoder.encode(get_assertion_id(vm));
  }
  if (path == "/assertion/at") {
    return encoder.encode(vm["index"].as<uint64_t>());
  }
  if (path == "/attestation/get" || path == "/attestation/is_attested" ||
      path == "/attestation/is_expired") {
    return encoder.encode(
        std::tuple{get_assertion_id(vm), get_address(vm, "subject")});
  }
  if (path == "/token/balance_of") {
    return encoder.encode(
        std::tuple{get_address(vm, "subject"), get_assertion_id(vm)});
  }
  if (path == "/address/is_blocked" || path == "/nonce") {
    return encoder.encode(get_address(vm, "address"));
  }
  notary::common::critical("unsupported query path '{}'", path);
}

std::string render(const notary::schema::bytes_view_t& bytes,
                   const std::string& format) {
  if (format == "hex") {
    return notary::schema::to_hex(bytes);
  }
  return notary::schema::to_base64(bytes);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  notary-tx keygen\n"
            << "  notary-tx address (--private-key HEX | --seed TEXT)\n"
            << "  notary-tx sign-attestation --text T --signed-at S [--revoke]"
               " [options]\n"
            << "  notary-tx transaction --payload P [options]\n"
            << "  notary-tx query-key --path P [options]\n"
            << "  notary-tx chain-id [--network NAME]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto format = std::string{};
  auto options = po::options_description{"notary-tx options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|address|sign-attestation|transaction|query-key|chain-id")(
      "format", po::value<std::string>(&format)->default_value("base64"),
      "base64|hex output for encoded bytes")(
      "payload", po::value<std::string>(), "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "network", po::value<std::string>()->default_value("notary-local"),
      "network name hashed into a chain id")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "registry-address", po::value<std::string>(),
      "20-byte registry address hex")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "value", po::value<std::string>()->default_value("0"),
      "value attached to the transaction")(
      "private-key", po::value<std::string>(), "sender private key hex")(
      "seed", po::value<std::string>(), "derive the sender key from text")(
      "sender", po::value<std::string>(),
      "sender address for an unsigned envelope")(
      "text", po::value<std::string>(), "assertion text")(
      "assertion-id", po::value<std::string>(),
      "assertion id hex (default: hash of --text)")(
      "freshness", po::value<uint64_t>()->default_value(3600),
      "freshness window in seconds")(
      "expiry", po::value<uint64_t>()->default_value(31536000),
      "expiry window in seconds")(
      "requires-gateway", po::value<bool>()->default_value(false),
      "only the gateway may submit attestations")(
      "gateway", po::value<std::string>(), "gateway address hex")(
      "controller", po::value<std::string>(), "controller address hex")(
      "subject", po::value<std::string>(), "subject address hex")(
      "subject-key", po::value<std::string>(), "subject private key hex")(
      "subject-seed", po::value<std::string>(),
      "derive the subject key from text")(
      "signed-at", po::value<uint64_t>()->default_value(0),
      "attestation timestamp in seconds")(
      "signature", po::value<std::string>(), "65-byte signature hex")(
      "revoke", "sign the revocation message instead")(
      "address", po::value<std::string>(), "address argument hex")(
      "amount", po::value<std::string>(), "decimal amount")(
      "index", po::value<uint64_t>()->default_value(0),
      "assertion list index");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    print_help(options);
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "keygen") {
    auto key = notary::crypto::generate_private_key();
    if (!key) {
      notary::common::critical("failed to generate a private key");
    }
    std::cout << notary::schema::to_hex(*key) << ' '
              << notary::schema::to_hex(address_of(*key)) << '\n';
    return 0;
  }

  if (command == "address") {
    auto key = get_key(vm, "private-key", "seed");
    std::cout << notary::schema::to_hex(address_of(key)) << '\n';
    return 0;
  }

  if (command == "sign-attestation") {
    auto key = get_key(vm, "subject-key", "subject-seed");
    auto text = get_string(vm, "text");
    auto message = vm.contains("revoke") ? notary::crypto::revocation_text(text)
                                         : text;
    auto signature = notary::crypto::sign_attestation(
        make_domain(vm), message, vm["signed-at"].as<uint64_t>(), key);
    if (!signature) {
      notary::common::critical("failed to sign attestation message");
    }
    std::cout << notary::schema::to_hex(*signature) << '\n';
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto key = get_optional_key(vm, "private-key", "seed");
    auto sender = key ? address_of(*key) : get_address(vm, "sender");
    auto transaction = notary::schema::transaction_t{
        .version = 1,
        .chain_id = get_hash32(vm, "chain-id"),
        .nonce = vm["nonce"].as<uint64_t>(),
        .sender = sender,
        .value = get_amount(vm, "value"),
        .payload = build_payload(vm)};
    if (key) {
      auto signature = notary::crypto::sign_digest(
          *key, notary::execution::signing_digest(transaction));
      if (!signature) {
        notary::common::critical("failed to sign transaction");
      }
      transaction.signature = *signature;
    }
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << render(notary::schema::make_bytes_view(encoded), format)
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    auto key = build_query_key(vm);
    std::cout << render(notary::schema::make_bytes_view(key), format) << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id =
        notary::blake3::hash(vm["network"].as<std::string>());
    std::cout << notary::schema::to_hex(chain_id) << '\n';
    return 0;
  }

  notary::common::critical(
      "command must be "
      "keygen|address|sign-attestation|transaction|query-key|chain-id");
}
