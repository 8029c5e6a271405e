#pragma once

#include <strongbox/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace strongbox::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  unauthorized = 10,
  asset_not_registered = 11,
  invalid_price = 12,
  asset_metadata_missing = 13,
  arithmetic_overflow = 14,
  nothing_to_deposit = 20,
  nothing_to_withdraw = 21,
  insufficient_balance = 22,
  withdraw_limit_exceeded = 23,
  capacity_exceeded = 24,
  failed_transfer = 25,
  invalid_direct_transfer = 26,
  reentrant_call = 27,
};

inline constexpr auto kTransactionErrorCodeMappings = std::array{
    std::pair<std::string_view, transaction_error_code>{
        "invalid_transaction", transaction_error_code::invalid_transaction},
    std::pair<std::string_view, transaction_error_code>{
        "unsupported_transaction_version",
        transaction_error_code::unsupported_transaction_version},
    std::pair<std::string_view, transaction_error_code>{
        "unauthorized", transaction_error_code::unauthorized},
    std::pair<std::string_view, transaction_error_code>{
        "asset_not_registered", transaction_error_code::asset_not_registered},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_price", transaction_error_code::invalid_price},
    std::pair<std::string_view, transaction_error_code>{
        "asset_metadata_missing",
        transaction_error_code::asset_metadata_missing},
    std::pair<std::string_view, transaction_error_code>{
        "arithmetic_overflow", transaction_error_code::arithmetic_overflow},
    std::pair<std::string_view, transaction_error_code>{
        "nothing_to_deposit", transaction_error_code::nothing_to_deposit},
    std::pair<std::string_view, transaction_error_code>{
        "nothing_to_withdraw", transaction_error_code::nothing_to_withdraw},
    std::pair<std::string_view, transaction_error_code>{
        "insufficient_balance", transaction_error_code::insufficient_balance},
    std::pair<std::string_view, transaction_error_code>{
        "withdraw_limit_exceeded",
        transaction_error_code::withdraw_limit_exceeded},
    std::pair<std::string_view, transaction_error_code>{
        "capacity_exceeded", transaction_error_code::capacity_exceeded},
    std::pair<std::string_view, transaction_error_code>{
        "failed_transfer", transaction_error_code::failed_transfer},
    std::pair<std::string_view, transaction_error_code>{
        "invalid_direct_transfer",
        transaction_error_code::invalid_direct_transfer},
    std::pair<std::string_view, transaction_error_code>{
        "reentrant_call", transaction_error_code::reentrant_call},
};

inline constexpr std::string_view to_string(
    const transaction_error_code value) {
  return to_string(value, kTransactionErrorCodeMappings).value_or("unknown");
}

}  // namespace strongbox::schema
