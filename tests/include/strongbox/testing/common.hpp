#pragma once

#include <strongbox/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace strongbox::testing {

inline strongbox::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = strongbox::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline strongbox::schema::principal_id_t make_principal(const uint8_t seed) {
  auto principal = strongbox::schema::principal_id_t{};
  principal[0] = 0xA0;
  principal[31] = seed;
  return principal;
}

/// Whole units scaled by 10^decimals.
inline strongbox::schema::amount_t units(const uint64_t whole,
                                         const unsigned decimals) {
  auto out = strongbox::schema::amount_t{whole};
  for (auto i = 0u; i < decimals; ++i) {
    out *= 10;
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace strongbox::testing
