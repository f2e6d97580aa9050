#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace notary::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using assertion_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

// r || s || v, v being the recovery id (0/1 or legacy 27/28).
using signature_t = std::array<uint8_t, 65>;
using private_key_t = std::array<uint8_t, 32>;
// SEC1 uncompressed point without the 0x04 tag: x || y.
using public_key_t = std::array<uint8_t, 64>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

address_t make_address(const bytes_view_t& bytes);
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_zero_address();
bool is_zero(const address_t& address);

std::optional<signature_t> try_make_signature(const bytes_view_t& bytes);

// Amounts travel as 32-byte big-endian words, the width of an EVM uint256.
hash32_t to_word(const amount_t& amount);
amount_t from_word(const hash32_t& word);
hash32_t to_word(uint64_t value);
std::optional<amount_t> try_parse_amount(const std::string_view& decimal);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const address_t& address);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);
std::optional<bytes_t> try_from_base64(const std::string_view encoded);

}  // namespace notary::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
