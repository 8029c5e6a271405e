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

namespace strongbox::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using principal_id_t = hash32_t;
using asset_id_t = hash32_t;
using price_source_id_t = hash32_t;
using amount_t = boost::multiprecision::uint256_t;
using value_t = amount_t;
using price_t = boost::multiprecision::int256_t;

/// Reserved asset id of the native currency.
inline constexpr auto kNativeAssetId = asset_id_t{};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

/// Parse 64 hex characters, with or without a 0x prefix.
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Parse a base-10 amount; std::nullopt on anything but digits.
std::optional<amount_t> try_make_amount(const std::string_view text);

/// Parse a base-10 sequence number; std::nullopt past 2^64 - 1.
std::optional<uint64_t> try_make_sequence(const std::string_view text);

}  // namespace strongbox::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
