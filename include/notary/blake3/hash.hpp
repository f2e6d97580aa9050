#pragma once
#include <blake3.h>
#include <notary/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace notary::blake3 {

/// Incremental BLAKE3-256 hasher. Every identifier in the registry
/// (assertion ids, revocation ids, typed-data digests, addresses) is derived
/// through this type.
class hasher final {
 public:
  hasher();

  hasher& update(const std::string_view& str);
  hasher& update(const std::span<const uint8_t>& bytes);

  notary::schema::hash32_t finalize() const;

 private:
  blake3_hasher state_;
};

notary::schema::hash32_t hash(const std::string_view& str);
notary::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

}  // namespace notary::blake3
