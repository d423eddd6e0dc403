#pragma once

#include <floodgate/schema/transaction_event_attribute.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::transaction_event_attribute<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::transaction_event_attribute<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
