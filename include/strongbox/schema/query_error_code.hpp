#pragma once

#include <cstdint>

// Schema type: query error code.
// Ledger workflow: read-path failure taxonomy returned by engine queries.
namespace strongbox::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  not_found = 2,
  unsupported_path = 3,
  valuation_failed = 4,
};

}  // namespace strongbox::schema
