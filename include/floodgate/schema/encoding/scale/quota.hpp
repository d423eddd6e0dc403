#pragma once

#include <floodgate/schema/quota.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::quota<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::quota<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
