#include <floodgate/schema/encoding/scale/transfer.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(send_transfer<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
  encode(o.amount, encoder);
}

void decode(send_transfer<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
  decode(o.amount, decoder);
}

void encode(receive_transfer<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
  encode(o.amount, encoder);
}

void decode(receive_transfer<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
  decode(o.amount, decoder);
}

void encode(undo_send<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
  encode(o.amount, encoder);
}

void decode(undo_send<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
  decode(o.amount, decoder);
}

}  // namespace floodgate::schema::encoding::scale
