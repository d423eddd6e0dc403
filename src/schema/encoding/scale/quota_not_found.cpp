#include <floodgate/schema/encoding/scale/quota_not_found.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(quota_not_found<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
  encode(o.quota_name, encoder);
}

void decode(quota_not_found<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
  decode(o.quota_name, decoder);
}

}  // namespace floodgate::schema::encoding::scale
