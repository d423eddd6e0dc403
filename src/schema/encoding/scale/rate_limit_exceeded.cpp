#include <floodgate/schema/encoding/scale/rate_limit_exceeded.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(rate_limit_exceeded<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
  encode(o.amount, encoder);
  encode(o.quota_name, encoder);
  encode(o.used, encoder);
  encode(o.maximum, encoder);
  encode(o.reset, encoder);
}

void decode(rate_limit_exceeded<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
  decode(o.amount, decoder);
  decode(o.quota_name, decoder);
  decode(o.used, decoder);
  decode(o.maximum, decoder);
  decode(o.reset, decoder);
}

}  // namespace floodgate::schema::encoding::scale
