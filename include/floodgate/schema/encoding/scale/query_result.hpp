#pragma once

#include <floodgate/schema/query_result.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::query_result<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::query_result<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
