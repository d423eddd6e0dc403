#include <floodgate/schema/encoding/scale/path.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(path<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.owner, encoder);
  encode(o.channel, encoder);
  encode(o.asset, encoder);
}

void decode(path<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.owner, decoder);
  decode(o.channel, decoder);
  decode(o.asset, decoder);
}

}  // namespace floodgate::schema::encoding::scale
