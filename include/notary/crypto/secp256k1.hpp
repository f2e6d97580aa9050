#pragma once

#include <notary/schema/primitives.hpp>
#include <optional>
#include <string_view>

namespace notary::crypto {

/// True when the linked OpenSSL exposes the secp256k1 curve.
bool available();

/// Address of a public key: the trailing 20 bytes of BLAKE3(x || y).
notary::schema::address_t address_from_public_key(
    const notary::schema::public_key_t& public_key);

std::optional<notary::schema::public_key_t> derive_public_key(
    const notary::schema::private_key_t& private_key);

std::optional<notary::schema::address_t> address_from_private_key(
    const notary::schema::private_key_t& private_key);

/// Recover the signing address of a 32-byte digest.
///
/// Rejects out-of-range `r`/`s`, high-`s` (malleable) signatures and
/// recovery ids other than 0, 1, 27 and 28.
std::optional<notary::schema::address_t> recover_address(
    const notary::schema::hash32_t& digest,
    const notary::schema::signature_t& signature);

/// Produce a low-`s` recoverable signature over a 32-byte digest.
std::optional<notary::schema::signature_t> sign_digest(
    const notary::schema::private_key_t& private_key,
    const notary::schema::hash32_t& digest);

std::optional<notary::schema::private_key_t> generate_private_key();

/// Deterministic key derivation for fixtures and tooling.
notary::schema::private_key_t private_key_from_seed(std::string_view seed);

}  // namespace notary::crypto
