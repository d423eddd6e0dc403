#include <floodgate/schema/encoding/scale/rate_limit.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(rate_limit<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.quota, encoder);
  encode(o.flow, encoder);
}

void decode(rate_limit<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.quota, decoder);
  decode(o.flow, decoder);
}

}  // namespace floodgate::schema::encoding::scale
