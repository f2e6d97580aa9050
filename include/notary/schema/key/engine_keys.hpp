#pragma once

#include <notary/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key makers for registry state. Keys are the
// SCALE encoding of (prefix, id...).
namespace notary::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kNonceKeyPrefix{"SYS|STATE|NONCE|"};
inline constexpr std::string_view kRoleStateKey{"SYS|STATE|ROLES"};
inline constexpr std::string_view kTipBalanceKey{"SYS|STATE|TIP_BALANCE"};
inline constexpr std::string_view kAssertionKeyPrefix{"SYS|STATE|ASSERTION|"};
inline constexpr std::string_view kAssertionListKeyPrefix{
    "SYS|STATE|ASSERTION_LIST|"};
inline constexpr std::string_view kAssertionListStateKey{
    "SYS|STATE|ASSERTION_LIST_STATE"};
inline constexpr std::string_view kAttestationKeyPrefix{"SYS|STATE|ATTEST|"};
inline constexpr std::string_view kBlocklistKeyPrefix{"SYS|STATE|BLOCKED|"};

inline const std::array<std::string_view, 9> kEngineKeyspaces{
    kStatePrefix,
    kNonceKeyPrefix,
    kRoleStateKey,
    kTipBalanceKey,
    kAssertionKeyPrefix,
    kAssertionListKeyPrefix,
    kAssertionListStateKey,
    kAttestationKeyPrefix,
    kBlocklistKeyPrefix};

template <typename Encoder, typename T>
notary::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                          std::string_view prefix,
                                          const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
notary::schema::bytes_t make_prefix_key(Encoder& encoder,
                                        std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
notary::schema::bytes_t make_nonce_key(
    Encoder& encoder,
    const notary::schema::address_t& sender) {
  return make_prefixed_key(encoder, kNonceKeyPrefix, sender);
}

template <typename Encoder>
notary::schema::bytes_t make_role_state_key(Encoder& encoder) {
  return make_prefix_key(encoder, kRoleStateKey);
}

template <typename Encoder>
notary::schema::bytes_t make_tip_balance_key(Encoder& encoder) {
  return make_prefix_key(encoder, kTipBalanceKey);
}

template <typename Encoder>
notary::schema::bytes_t make_assertion_key(
    Encoder& encoder,
    const notary::schema::assertion_id_t& assertion_id) {
  return make_prefixed_key(encoder, kAssertionKeyPrefix, assertion_id);
}

template <typename Encoder>
notary::schema::bytes_t make_assertion_list_key(Encoder& encoder,
                                                uint64_t index) {
  return make_prefixed_key(encoder, kAssertionListKeyPrefix, index);
}

template <typename Encoder>
notary::schema::bytes_t make_assertion_list_state_key(Encoder& encoder) {
  return make_prefix_key(encoder, kAssertionListStateKey);
}

template <typename Encoder>
notary::schema::bytes_t make_attestation_key(
    Encoder& encoder,
    const notary::schema::assertion_id_t& assertion_id,
    const notary::schema::address_t& subject) {
  return make_prefixed_key(encoder, kAttestationKeyPrefix,
                           std::tuple{assertion_id, subject});
}

template <typename Encoder>
notary::schema::bytes_t make_blocklist_key(
    Encoder& encoder,
    const notary::schema::address_t& address) {
  return make_prefixed_key(encoder, kBlocklistKeyPrefix, address);
}

}  // namespace notary::schema::key
