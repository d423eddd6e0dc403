#pragma once

#include <floodgate/schema/path.hpp>
#include <floodgate/schema/primitives.hpp>

// Schema types: send transfer / receive transfer / undo send.
// Value moving through a path. The caller computes the amount; undo_send
// reverses an outbound transfer that failed on the far side.
namespace floodgate::schema {

template <uint16_t Version>
struct send_transfer;

template <>
struct send_transfer<1> final {
  uint16_t version{1};
  path_t path;
  amount_t amount{};
};

using send_transfer_t = send_transfer<1>;

template <uint16_t Version>
struct receive_transfer;

template <>
struct receive_transfer<1> final {
  uint16_t version{1};
  path_t path;
  amount_t amount{};
};

using receive_transfer_t = receive_transfer<1>;

template <uint16_t Version>
struct undo_send;

template <>
struct undo_send<1> final {
  uint16_t version{1};
  path_t path;
  amount_t amount{};
};

using undo_send_t = undo_send<1>;

}  // namespace floodgate::schema
