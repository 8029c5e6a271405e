#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/role_id.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Ledger workflow: canonical key prefixes and key codecs for registry,
// balances, limits, roles, history and the committed checkpoint.
namespace strongbox::schema::key {

inline constexpr std::string_view kAssetKeyPrefix{"SYS|STATE|ASSET|"};
inline constexpr std::string_view kRegistryKeyPrefix{"SYS|STATE|REGISTRY|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kHeldKeyPrefix{"SYS|STATE|HELD|"};
inline constexpr std::string_view kCountersKeyPrefix{"SYS|STATE|COUNTERS|"};
inline constexpr std::string_view kLimitsKeyPrefix{"SYS|STATE|LIMITS|"};
inline constexpr std::string_view kRoleAssignmentKeyPrefix{
    "SYS|STATE|ROLE_ASSIGNMENT|"};
inline constexpr std::string_view kCommittedKeyPrefix{"SYS|APP|COMMITTED|"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};

/// Big-endian sequence bytes, so history keys sort in sequence order.
using sequence_key_t = std::array<uint8_t, 8>;

inline sequence_key_t make_sequence_key(uint64_t sequence) {
  auto bytes = sequence_key_t{};
  for (auto i = bytes.size(); i > 0; --i) {
    bytes[i - 1] = static_cast<uint8_t>(sequence & 0xFFu);
    sequence >>= 8u;
  }
  return bytes;
}

template <typename Encoder, typename T>
strongbox::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
strongbox::schema::bytes_t make_asset_key(
    Encoder& encoder,
    const strongbox::schema::asset_id_t& asset_id) {
  return make_prefixed_key(encoder, kAssetKeyPrefix, asset_id);
}

template <typename Encoder>
strongbox::schema::bytes_t make_registry_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kRegistryKeyPrefix,
                           std::string_view{"ORDER"});
}

template <typename Encoder>
strongbox::schema::bytes_t make_balance_key(
    Encoder& encoder,
    const strongbox::schema::principal_id_t& principal,
    const strongbox::schema::asset_id_t& asset_id) {
  return make_prefixed_key(encoder, kBalanceKeyPrefix,
                           std::tuple{principal, asset_id});
}

template <typename Encoder>
strongbox::schema::bytes_t make_held_key(
    Encoder& encoder,
    const strongbox::schema::asset_id_t& asset_id) {
  return make_prefixed_key(encoder, kHeldKeyPrefix, asset_id);
}

template <typename Encoder>
strongbox::schema::bytes_t make_counters_key(
    Encoder& encoder,
    const strongbox::schema::principal_id_t& principal) {
  return make_prefixed_key(encoder, kCountersKeyPrefix, principal);
}

template <typename Encoder>
strongbox::schema::bytes_t make_limits_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kLimitsKeyPrefix,
                           std::string_view{"CURRENT"});
}

template <typename Encoder>
strongbox::schema::bytes_t make_role_assignment_key(
    Encoder& encoder,
    const strongbox::schema::principal_id_t& subject,
    const strongbox::schema::role_id_t role) {
  return make_prefixed_key(encoder, kRoleAssignmentKeyPrefix,
                           std::tuple{subject, role});
}

template <typename Encoder>
strongbox::schema::bytes_t make_committed_key(Encoder& encoder) {
  return make_prefixed_key(encoder, kCommittedKeyPrefix,
                           std::string_view{"LATEST"});
}

template <typename Encoder>
strongbox::schema::bytes_t make_history_key(Encoder& encoder,
                                            uint64_t sequence) {
  return make_prefixed_key(encoder, kHistoryPrefix,
                           make_sequence_key(sequence));
}

}  // namespace strongbox::schema::key
