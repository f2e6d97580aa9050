#pragma once
#include <notary/common/critical.hpp>
#include <notary/schema/encoding/encoder.hpp>
#include <notary/schema/encoding/scale/app_info.hpp>
#include <notary/schema/encoding/scale/assertion_list_state.hpp>
#include <notary/schema/encoding/scale/assertion_record.hpp>
#include <notary/schema/encoding/scale/attestation_record.hpp>
#include <notary/schema/encoding/scale/block_result.hpp>
#include <notary/schema/encoding/scale/commit_result.hpp>
#include <notary/schema/encoding/scale/primitives.hpp>
#include <notary/schema/encoding/scale/query_result.hpp>
#include <notary/schema/encoding/scale/role_state.hpp>
#include <notary/schema/encoding/scale/transaction.hpp>
#include <notary/schema/encoding/scale/transaction_result.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace notary::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  notary::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, notary::schema::bytes_t& out);

  template <typename T>
  T decode(const notary::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const notary::schema::bytes_view_t& bytes);
};

template <typename T>
notary::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    notary::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        notary::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const notary::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    notary::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const notary::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace notary::schema::encoding
