#pragma once

#include <notary/crypto/typed_data.hpp>
#include <notary/schema/primitives.hpp>
#include <string_view>

namespace notary::crypto {

/// Check that `signature` over (text, signed_at) under `domain` was produced
/// by `signer`. A zero timestamp never verifies.
bool verify_attestation_signature(
    const domain_t& domain,
    std::string_view text,
    notary::schema::timestamp_seconds_t signed_at,
    const notary::schema::address_t& signer,
    const notary::schema::signature_t& signature);

std::optional<notary::schema::signature_t> sign_attestation(
    const domain_t& domain,
    std::string_view text,
    notary::schema::timestamp_seconds_t signed_at,
    const notary::schema::private_key_t& private_key);

}  // namespace notary::crypto
