#pragma once

#include <strongbox/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: role id.
// Ledger workflow: admin manages role assignments, operator manages the asset
// registry and the capacity/withdraw limits.
namespace strongbox::schema {

enum class role_id_t : uint8_t { admin = 0, operator_ = 1 };

inline constexpr auto kRoleIdMappings = std::array{
    std::pair<std::string_view, role_id_t>{"admin", role_id_t::admin},
    std::pair<std::string_view, role_id_t>{"operator", role_id_t::operator_},
};

template <>
inline std::optional<role_id_t> try_from_string<role_id_t>(
    const std::string_view value) {
  return from_string(value, kRoleIdMappings);
}

inline constexpr std::string_view to_string(const role_id_t value) {
  return to_string(value, kRoleIdMappings).value_or("unknown");
}

}  // namespace strongbox::schema
