#include <floodgate/schema/encoding/scale/reset_path_quota.hpp>

using namespace floodgate::schema;

namespace floodgate::schema::encoding::scale {

void encode(reset_path_quota<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.path, encoder);
  encode(o.quota_name, encoder);
}

void decode(reset_path_quota<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.path, decoder);
  decode(o.quota_name, decoder);
}

}  // namespace floodgate::schema::encoding::scale
