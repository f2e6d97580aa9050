#pragma once
#include <notary/schema/primitives.hpp>
#include <optional>
#include <span>

namespace notary::schema::encoding {

// Build-time selected wire/storage codec. The library tag picks the
// implementation; callers only see encode/decode.
template <typename Library>
struct encoder {
  template <typename T>
  notary::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, notary::schema::bytes_t& out);

  template <typename T>
  T decode(const notary::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const notary::schema::bytes_view_t& bytes);
};

}  // namespace notary::schema::encoding
