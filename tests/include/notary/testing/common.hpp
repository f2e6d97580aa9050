#pragma once

#include <notary/crypto/secp256k1.hpp>
#include <notary/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace notary::testing {

inline notary::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = notary::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline notary::schema::address_t make_address(const uint8_t seed) {
  auto out = notary::schema::address_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Key pair derived from a fixed seed so tests are reproducible.
struct signer final {
  notary::schema::private_key_t private_key{};
  notary::schema::address_t address{};
};

inline signer make_signer(const std::string_view seed) {
  auto out = signer{};
  out.private_key = notary::crypto::private_key_from_seed(seed);
  out.address = *notary::crypto::address_from_private_key(out.private_key);
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = uint64_t{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace notary::testing
