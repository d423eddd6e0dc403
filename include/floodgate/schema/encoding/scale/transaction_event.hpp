#pragma once

#include <floodgate/schema/encoding/scale/transaction_event_attribute.hpp>
#include <floodgate/schema/transaction_event.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::transaction_event<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::transaction_event<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
