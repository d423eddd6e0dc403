#pragma once

#include <floodgate/schema/path.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::path<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::path<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
