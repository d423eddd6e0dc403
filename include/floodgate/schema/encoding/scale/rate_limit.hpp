#pragma once

#include <floodgate/schema/encoding/scale/flow.hpp>
#include <floodgate/schema/encoding/scale/quota.hpp>
#include <floodgate/schema/rate_limit.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::rate_limit<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::rate_limit<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
