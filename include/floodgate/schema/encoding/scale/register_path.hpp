#pragma once

#include <floodgate/schema/encoding/scale/path.hpp>
#include <floodgate/schema/encoding/scale/quota.hpp>
#include <floodgate/schema/register_path.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::register_path<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::register_path<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
