#include <floodgate/schema/encoding/scale/deregister_path.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(deregister_path<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
}

void decode(deregister_path<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
}

}  // namespace floodgate::schema::encoding::scale
