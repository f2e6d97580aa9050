#pragma once

#include <notary/schema/primitives.hpp>
#include <string>
#include <string_view>

// Structured-message hashing for attestation signatures.
//
// digest = H(0x19 || 0x01 || domain_separator || struct_hash)
// domain_separator = H(H(domain type) || H(name) || H(version) || chain_id ||
//                      word(verifying_address))
// struct_hash = H(H(attestation type) || H(text) || word(signed_at))
//
// H is BLAKE3-256 and word() left-pads to 32 bytes big-endian.
namespace notary::crypto {

inline constexpr std::string_view kDomainName{"Notary"};
inline constexpr std::string_view kDomainVersion{"1.0"};
inline constexpr std::string_view kDomainType{
    "NotaryDomain(string name,string version,bytes32 chainId,address "
    "verifyingContract)"};
inline constexpr std::string_view kAttestationType{
    "attestation(string assertion,uint256 signdate)"};
inline constexpr std::string_view kRevokedPrefix{"Revoked: "};

struct domain_t final {
  std::string name{kDomainName};
  std::string version{kDomainVersion};
  notary::schema::hash32_t chain_id{};
  notary::schema::address_t verifying_address{};
};

notary::schema::hash32_t domain_separator(const domain_t& domain);

notary::schema::hash32_t attestation_struct_hash(
    std::string_view text,
    notary::schema::timestamp_seconds_t signed_at);

notary::schema::hash32_t attestation_digest(
    const domain_t& domain,
    std::string_view text,
    notary::schema::timestamp_seconds_t signed_at);

/// Message a subject signs to withdraw an attestation of `text`.
std::string revocation_text(std::string_view text);

}  // namespace notary::crypto
