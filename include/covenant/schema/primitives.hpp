#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace covenant::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;

// Principals (owners, verifiers, the ledger itself) and assets are opaque
// 32-byte identities.
using address_t = hash32_t;
using asset_id_t = hash32_t;
using commitment_id_t = hash32_t;
using token_id_t = uint32_t;
using amount_t = boost::multiprecision::int128_t;
using timestamp_seconds_t = uint64_t;

inline constexpr uint64_t kSecondsPerDay = 86400;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const hash32_t& hash);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

/// Decimal rendering of an amount, with a leading '-' when negative.
std::string to_string(const amount_t& amount);

/// Parse an optionally signed decimal amount. std::nullopt on empty input,
/// stray characters or a value outside the amount range.
std::optional<amount_t> try_parse_amount(const std::string_view text);

/// Parse a decimal token id. std::nullopt on stray characters or a value that
/// does not fit token_id_t.
std::optional<token_id_t> try_parse_token_id(const std::string_view text);

}  // namespace covenant::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
