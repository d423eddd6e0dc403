#pragma once

#include <floodgate/schema/flow_direction.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(floodgate::schema,
                             flow_direction_t,
                             floodgate::schema::flow_direction_t::in,
                             floodgate::schema::flow_direction_t::out)
