#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "engine.hpp"
#include "types.hpp"

namespace road_geometry
{

nlohmann::json route_to_json(const RouteResult &route);
nlohmann::json bottleneck_to_json(const BottleneckReport &report);
nlohmann::json capacity_to_json(const CapacityAnalysis &analysis);
nlohmann::json network_stats_to_json(const NetworkStats &stats);
nlohmann::json analysis_to_json(const NetworkAnalysis &analysis);
nlohmann::json routes_to_json(const RoutesResponse &response);
nlohmann::json segment_to_json(const SegmentGeometry &segment);
nlohmann::json error_to_json(ErrorKind kind, const std::string &message);

} // namespace road_geometry
