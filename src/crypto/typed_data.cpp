#include <notary/blake3/hash.hpp>
#include <notary/crypto/typed_data.hpp>

#include <algorithm>
#include <array>

namespace notary::crypto {

namespace {

notary::schema::bytes_view_t view(const notary::schema::hash32_t& hash) {
  return notary::schema::bytes_view_t{hash.data(), hash.size()};
}

notary::schema::hash32_t address_word(
    const notary::schema::address_t& address) {
  auto word = notary::schema::hash32_t{};
  std::copy(std::begin(address), std::end(address),
            std::end(word) - static_cast<std::ptrdiff_t>(address.size()));
  return word;
}

}  // namespace

notary::schema::hash32_t domain_separator(const domain_t& domain) {
  static const auto type_hash = notary::blake3::hash(kDomainType);
  const auto name_hash = notary::blake3::hash(domain.name);
  const auto version_hash = notary::blake3::hash(domain.version);
  const auto verifying_word = address_word(domain.verifying_address);
  return notary::blake3::hasher{}
      .update(view(type_hash))
      .update(view(name_hash))
      .update(view(version_hash))
      .update(view(domain.chain_id))
      .update(view(verifying_word))
      .finalize();
}

notary::schema::hash32_t attestation_struct_hash(
    std::string_view text,
    notary::schema::timestamp_seconds_t signed_at) {
  static const auto type_hash = notary::blake3::hash(kAttestationType);
  const auto text_hash = notary::blake3::hash(text);
  const auto signed_at_word = notary::schema::to_word(signed_at);
  return notary::blake3::hasher{}
      .update(view(type_hash))
      .update(view(text_hash))
      .update(view(signed_at_word))
      .finalize();
}

notary::schema::hash32_t attestation_digest(
    const domain_t& domain,
    std::string_view text,
    notary::schema::timestamp_seconds_t signed_at) {
  static constexpr auto kPrefix = std::array<uint8_t, 2>{0x19, 0x01};
  const auto separator = domain_separator(domain);
  const auto struct_hash = attestation_struct_hash(text, signed_at);
  return notary::blake3::hasher{}
      .update(notary::schema::bytes_view_t{kPrefix.data(), kPrefix.size()})
      .update(view(separator))
      .update(view(struct_hash))
      .finalize();
}

std::string revocation_text(std::string_view text) {
  auto out = std::string{kRevokedPrefix};
  out.append(text);
  return out;
}

}  // namespace notary::crypto
