#pragma once

#include <floodgate/schema/flow.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::flow<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::flow<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
