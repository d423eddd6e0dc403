#pragma once

#include <floodgate/schema/encoding/scale/path.hpp>
#include <floodgate/schema/reset_path_quota.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::reset_path_quota<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::reset_path_quota<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
