#include <floodgate/schema/encoding/scale/quota.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(quota<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.name, encoder);
  encode(o.max_send, encoder);
  encode(o.max_receive, encoder);
  encode(o.duration, encoder);
}

void decode(quota<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.name, decoder);
  decode(o.max_send, decoder);
  decode(o.max_receive, decoder);
  decode(o.duration, decoder);
}

}  // namespace floodgate::schema::encoding::scale
