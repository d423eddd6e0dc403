#pragma once

#include <floodgate/schema/encoding/scale/path.hpp>
#include <floodgate/schema/rate_limit_exceeded.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::rate_limit_exceeded<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::rate_limit_exceeded<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
