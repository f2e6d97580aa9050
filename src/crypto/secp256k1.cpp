#include <notary/blake3/hash.hpp>
#include <notary/common/critical.hpp>
#include <notary/crypto/secp256k1.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <memory>
#include <vector>

namespace notary::crypto {

namespace {

using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using secret_bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using ossl_param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

using encoded_point_t = std::array<uint8_t, 65>;

const EC_GROUP* secp256k1_group() {
  static const auto group = ec_group_ptr{
      EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free};
  return group.get();
}

const BIGNUM* half_order() {
  static const auto half = [] {
    auto value = bignum_ptr{BN_new(), BN_free};
    const auto* group = secp256k1_group();
    if (!value || group == nullptr ||
        BN_rshift1(value.get(), EC_GROUP_get0_order(group)) != 1) {
      return bignum_ptr{nullptr, BN_free};
    }
    return value;
  }();
  return half.get();
}

bool valid_scalar(const BIGNUM* scalar, const BIGNUM* order) {
  return !BN_is_zero(scalar) && !BN_is_negative(scalar) &&
         BN_cmp(scalar, order) < 0;
}

bool valid_private_key(const notary::schema::private_key_t& private_key) {
  const auto* group = secp256k1_group();
  if (group == nullptr) {
    return false;
  }
  auto scalar = secret_bignum_ptr{
      BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()),
                nullptr),
      BN_clear_free};
  return scalar && valid_scalar(scalar.get(), EC_GROUP_get0_order(group));
}

std::optional<notary::schema::public_key_t> encode_point(const EC_GROUP* group,
                                                         const EC_POINT* point,
                                                         BN_CTX* ctx) {
  auto encoded = encoded_point_t{};
  auto written =
      EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                         encoded.data(), encoded.size(), ctx);
  if (written != encoded.size() || encoded[0] != 0x04) {
    return std::nullopt;
  }
  auto public_key = notary::schema::public_key_t{};
  std::copy(std::next(std::begin(encoded)), std::end(encoded),
            std::begin(public_key));
  return public_key;
}

evp_pkey_ptr make_signing_key(
    const notary::schema::private_key_t& private_key,
    const notary::schema::public_key_t& public_key) {
  auto scalar = secret_bignum_ptr{
      BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()),
                nullptr),
      BN_clear_free};
  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!scalar || !builder) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto encoded = encoded_point_t{};
  encoded[0] = 0x04;
  std::copy(std::begin(public_key), std::end(public_key),
            std::next(std::begin(encoded)));

  if (OSSL_PARAM_BLD_push_utf8_string(builder.get(),
                                      OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1",
                                      0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             scalar.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       encoded.data(), encoded.size()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto params =
      ossl_param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!params || !key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return evp_pkey_ptr{nullptr, EVP_PKEY_free};
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

}  // namespace

bool available() {
  static const auto available_now =
      secp256k1_group() != nullptr && half_order() != nullptr;
  return available_now;
}

notary::schema::address_t address_from_public_key(
    const notary::schema::public_key_t& public_key) {
  auto digest = notary::blake3::hash(
      notary::schema::bytes_view_t{public_key.data(), public_key.size()});
  auto address = notary::schema::address_t{};
  std::copy(std::end(digest) - static_cast<std::ptrdiff_t>(address.size()),
            std::end(digest), std::begin(address));
  return address;
}

std::optional<notary::schema::public_key_t> derive_public_key(
    const notary::schema::private_key_t& private_key) {
  const auto* group = secp256k1_group();
  if (group == nullptr || !valid_private_key(private_key)) {
    return std::nullopt;
  }

  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto scalar = secret_bignum_ptr{
      BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()),
                nullptr),
      BN_clear_free};
  auto point = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!ctx || !scalar || !point) {
    return std::nullopt;
  }
  if (EC_POINT_mul(group, point.get(), scalar.get(), nullptr, nullptr,
                   ctx.get()) != 1) {
    return std::nullopt;
  }
  return encode_point(group, point.get(), ctx.get());
}

std::optional<notary::schema::address_t> address_from_private_key(
    const notary::schema::private_key_t& private_key) {
  auto public_key = derive_public_key(private_key);
  if (!public_key) {
    return std::nullopt;
  }
  return address_from_public_key(*public_key);
}

std::optional<notary::schema::address_t> recover_address(
    const notary::schema::hash32_t& digest,
    const notary::schema::signature_t& signature) {
  const auto* group = secp256k1_group();
  if (group == nullptr || half_order() == nullptr) {
    return std::nullopt;
  }

  auto recovery_id = signature[64];
  if (recovery_id >= 27) {
    recovery_id = static_cast<uint8_t>(recovery_id - 27);
  }
  if (recovery_id > 1) {
    return std::nullopt;
  }

  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_free};
  auto s = bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  auto e = bignum_ptr{BN_bin2bn(digest.data(), 32, nullptr), BN_free};
  if (!ctx || !r || !s || !e) {
    return std::nullopt;
  }

  const auto* order = EC_GROUP_get0_order(group);
  if (!valid_scalar(r.get(), order) || !valid_scalar(s.get(), order) ||
      BN_cmp(s.get(), half_order()) > 0) {
    return std::nullopt;
  }

  // R has x = r and the y parity carried by the recovery id.
  auto point_r = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!point_r ||
      EC_POINT_set_compressed_coordinates(group, point_r.get(), r.get(),
                                          recovery_id, ctx.get()) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 * (s * R - e * G)
  auto r_inverse =
      bignum_ptr{BN_mod_inverse(nullptr, r.get(), order, ctx.get()), BN_free};
  auto negated_e = bignum_ptr{BN_new(), BN_free};
  auto u1 = bignum_ptr{BN_new(), BN_free};
  auto u2 = bignum_ptr{BN_new(), BN_free};
  if (!r_inverse || !negated_e || !u1 || !u2) {
    return std::nullopt;
  }
  if (BN_nnmod(e.get(), e.get(), order, ctx.get()) != 1 ||
      BN_mod_sub(negated_e.get(), order, e.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u1.get(), negated_e.get(), r_inverse.get(), order,
                 ctx.get()) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), order, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto point_q = ec_point_ptr{EC_POINT_new(group), EC_POINT_free};
  if (!point_q || EC_POINT_mul(group, point_q.get(), u1.get(), point_r.get(),
                               u2.get(), ctx.get()) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group, point_q.get()) == 1) {
    return std::nullopt;
  }

  auto public_key = encode_point(group, point_q.get(), ctx.get());
  if (!public_key) {
    return std::nullopt;
  }
  return address_from_public_key(*public_key);
}

std::optional<notary::schema::signature_t> sign_digest(
    const notary::schema::private_key_t& private_key,
    const notary::schema::hash32_t& digest) {
  const auto* group = secp256k1_group();
  auto public_key = derive_public_key(private_key);
  if (group == nullptr || !public_key) {
    return std::nullopt;
  }

  auto pkey = make_signing_key(private_key, *public_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto sign_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr),
      EVP_PKEY_CTX_free};
  if (!sign_ctx || EVP_PKEY_sign_init(sign_ctx.get()) != 1) {
    return std::nullopt;
  }

  auto der_size = size_t{};
  if (EVP_PKEY_sign(sign_ctx.get(), nullptr, &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_PKEY_sign(sign_ctx.get(), der.data(), &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!sig) {
    return std::nullopt;
  }

  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(sig.get(), &r, &s);

  auto low_s = bignum_ptr{BN_dup(s), BN_free};
  if (!low_s) {
    return std::nullopt;
  }
  if (BN_cmp(s, half_order()) > 0 &&
      BN_sub(low_s.get(), EC_GROUP_get0_order(group), s) != 1) {
    return std::nullopt;
  }

  auto signature = notary::schema::signature_t{};
  if (BN_bn2binpad(r, signature.data(), 32) != 32 ||
      BN_bn2binpad(low_s.get(), signature.data() + 32, 32) != 32) {
    return std::nullopt;
  }

  auto expected = address_from_public_key(*public_key);
  for (auto recovery_id = uint8_t{0}; recovery_id <= 1; ++recovery_id) {
    signature[64] = recovery_id;
    if (recover_address(digest, signature) == expected) {
      return signature;
    }
  }
  return std::nullopt;
}

std::optional<notary::schema::private_key_t> generate_private_key() {
  auto private_key = notary::schema::private_key_t{};
  for (auto attempt = 0; attempt < 8; ++attempt) {
    if (RAND_priv_bytes(private_key.data(),
                        static_cast<int>(private_key.size())) != 1) {
      return std::nullopt;
    }
    if (valid_private_key(private_key)) {
      return private_key;
    }
  }
  return std::nullopt;
}

notary::schema::private_key_t private_key_from_seed(std::string_view seed) {
  if (!available()) {
    notary::common::critical("secp256k1 is not available in OpenSSL");
  }
  auto private_key = notary::blake3::hasher{}
                         .update(std::string_view{"notary-key-seed|"})
                         .update(seed)
                         .finalize();
  while (!valid_private_key(private_key)) {
    private_key = notary::blake3::hash(notary::schema::bytes_view_t{
        private_key.data(), private_key.size()});
  }
  return private_key;
}

}  // namespace notary::crypto
