#pragma once

#include "types.hpp"

namespace road_geometry
{

// Great-circle distance in metres.
double haversine(double lat1, double lon1, double lat2, double lon2);
double haversine(const Point &a, const Point &b);

Point midpoint(const Point &a, const Point &b);

bool is_valid_point(const Point &point);

} // namespace road_geometry
