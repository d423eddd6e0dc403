#pragma once

#include <cstdint>

namespace floodgate::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  rate_limit_exceeded = 3,
  quota_not_found = 4,
  storage_failure = 5,
};

}  // namespace floodgate::schema
