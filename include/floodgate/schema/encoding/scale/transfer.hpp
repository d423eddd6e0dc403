#pragma once

#include <floodgate/schema/encoding/scale/path.hpp>
#include <floodgate/schema/transfer.hpp>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding::scale {

void encode(floodgate::schema::send_transfer<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::send_transfer<1>&& o, ::scale::Decoder& decoder);

void encode(floodgate::schema::receive_transfer<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::receive_transfer<1>&& o, ::scale::Decoder& decoder);

void encode(floodgate::schema::undo_send<1>&& o, ::scale::Encoder& encoder);
void decode(floodgate::schema::undo_send<1>&& o, ::scale::Decoder& decoder);

}  // namespace floodgate::schema::encoding::scale
