#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "network.hpp"
#include "types.hpp"

namespace road_geometry
{

// Linear haversine scan. Throws EngineError(EmptyNetwork) on a network with
// no nodes.
long nearest_node(const Network &network, const Point &point);

// Minimum-travel-time path between two node ids. Edges in `mask` are treated
// as absent. A disconnected pair yields success == false with NoPathFound.
RouteResult shortest_path_between(const Network &network, long origin_node, long destination_node,
                                  const EdgeMask *mask = nullptr);

RouteResult shortest_route(const Network &network, const Point &origin, const Point &destination);

// Edge removed to derive an alternate from `primary`: the edge leaving the
// middle node of the path, or the only edge of a one-edge path.
std::optional<std::size_t> midpoint_edge(const RouteResult &primary);

// Primary route plus an alternate computed with the primary's midpoint edge
// excluded. `avoid_segment_ids` is accepted but not mapped to graph edges;
// the midpoint edge is removed whatever it contains.
RoutePlan alternate_route(const Network &network, const Point &origin, const Point &destination,
                          const std::vector<std::string> &avoid_segment_ids);

// Up to two node pairs taken from the network's node order, each with its
// midpoint-edge alternate when one exists.
std::vector<AlternativeRouteSample> sample_alternative_routes(const Network &network);

} // namespace road_geometry
