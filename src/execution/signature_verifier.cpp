#include <notary/blake3/hash.hpp>
#include <notary/crypto/secp256k1.hpp>
#include <notary/execution/signature_verifier.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>

#include <string_view>

namespace notary::execution {

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

inline constexpr std::string_view kTransactionDomainTag{"NOTARY|TX|v1"};

}  // namespace

notary::schema::hash32_t signing_digest(
    const notary::schema::transaction_t& tx) {
  auto unsigned_tx = tx;
  unsigned_tx.signature = notary::schema::signature_t{};
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(unsigned_tx);
  return notary::blake3::hasher{}
      .update(kTransactionDomainTag)
      .update(notary::schema::make_bytes_view(encoded))
      .finalize();
}

signature_verifier_t make_secp256k1_verifier() {
  return [](const notary::schema::hash32_t& digest,
            const notary::schema::address_t& signer,
            const notary::schema::signature_t& signature) {
    auto recovered = notary::crypto::recover_address(digest, signature);
    return recovered.has_value() && *recovered == signer;
  };
}

}  // namespace notary::execution
