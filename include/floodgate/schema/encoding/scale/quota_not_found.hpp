#pragma once

#include <floodgate/schema/encoding/scale/path.hpp>
#include <floodgate/schema/quota_not_found.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::quota_not_found<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::quota_not_found<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
