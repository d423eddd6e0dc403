#include <floodgate/schema/encoding/scale/register_path.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(register_path<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
  encode(o.quotas, encoder);
}

void decode(register_path<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
  decode(o.quotas, decoder);
}

}  // namespace floodgate::schema::encoding::scale
