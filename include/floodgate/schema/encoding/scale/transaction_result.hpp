#pragma once

#include <floodgate/schema/encoding/scale/transaction_event.hpp>
#include <floodgate/schema/transaction_result.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::transaction_result<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::transaction_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
