#pragma once

#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction.hpp>
#include <functional>

namespace notary::execution {

using signature_verifier_t =
    std::function<bool(const notary::schema::hash32_t& digest,
                       const notary::schema::address_t& signer,
                       const notary::schema::signature_t& signature)>;

/// Digest a sender signs to authorize `tx`: BLAKE3 over a domain tag and the
/// SCALE encoding of the envelope with a zeroed signature.
notary::schema::hash32_t signing_digest(const notary::schema::transaction_t& tx);

/// secp256k1 recovery against the claimed signer.
signature_verifier_t make_secp256k1_verifier();

}  // namespace notary::execution
