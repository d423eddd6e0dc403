#include <floodgate/schema/encoding/scale/flow.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(flow<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.inflow, encoder);
  encode(o.outflow, encoder);
  encode(o.period_end, encoder);
}

void decode(flow<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.inflow, decoder);
  decode(o.outflow, decoder);
  decode(o.period_end, decoder);
}

}  // namespace floodgate::schema::encoding::scale
