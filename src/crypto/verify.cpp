#include <notary/crypto/secp256k1.hpp>
#include <notary/crypto/verify.hpp>

#include <spdlog/spdlog.h>

namespace notary::crypto {

bool verify_attestation_signature(
    const domain_t& domain,
    std::string_view text,
    notary::schema::timestamp_seconds_t signed_at,
    const notary::schema::address_t& signer,
    const notary::schema::signature_t& signature) {
  if (signed_at == 0) {
    return false;
  }
  auto digest = attestation_digest(domain, text, signed_at);
  auto recovered = recover_address(digest, signature);
  if (!recovered) {
    spdlog::debug("Malformed attestation signature for {}",
                  notary::schema::to_hex(signer));
    return false;
  }
  return *recovered == signer;
}

std::optional<notary::schema::signature_t> sign_attestation(
    const domain_t& domain,
    std::string_view text,
    notary::schema::timestamp_seconds_t signed_at,
    const notary::schema::private_key_t& private_key) {
  return sign_digest(private_key, attestation_digest(domain, text, signed_at));
}

}  // namespace notary::crypto
