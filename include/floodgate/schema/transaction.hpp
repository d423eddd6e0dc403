#pragma once
#include <floodgate/schema/deregister_path.hpp>
#include <floodgate/schema/primitives.hpp>
#include <floodgate/schema/register_path.hpp>
#include <floodgate/schema/reset_path_quota.hpp>
#include <floodgate/schema/transfer.hpp>
#include <variant>

namespace floodgate::schema {

using transaction_payload_t = std::variant<register_path_t,
                                           deregister_path_t,
                                           reset_path_quota_t,
                                           send_transfer_t,
                                           receive_transfer_t,
                                           undo_send_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace floodgate::schema
