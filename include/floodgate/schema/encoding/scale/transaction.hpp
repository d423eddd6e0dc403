#pragma once

#include <floodgate/schema/encoding/scale/deregister_path.hpp>
#include <floodgate/schema/encoding/scale/register_path.hpp>
#include <floodgate/schema/encoding/scale/reset_path_quota.hpp>
#include <floodgate/schema/encoding/scale/transfer.hpp>
#include <floodgate/schema/transaction.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::transaction<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::transaction<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
