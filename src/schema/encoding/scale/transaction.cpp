#include <floodgate/schema/encoding/scale/transaction.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.payload, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.payload, decoder);
}

}  // namespace floodgate::schema::encoding::scale
