#pragma once
#include <notary/schema/primitives.hpp>
#include <cstdint>

// Schema type: attestation record.
// One row per (assertion, subject). `signed_at == 0` means the subject never
// attested.
namespace notary::schema {

template <uint16_t Version>
struct attestation_record;

template <>
struct attestation_record<1> final {
  uint16_t version{1};
  timestamp_seconds_t signed_at{};
  bool revoked{};
};

using attestation_record_t = attestation_record<1>;

}  // namespace notary::schema
