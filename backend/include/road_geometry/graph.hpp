#pragma once

#include "config.hpp"
#include "network.hpp"
#include "overpass.hpp"
#include "types.hpp"

namespace road_geometry
{

// Speed and travel-time augmentation of a provider graph. Edges without a
// speed estimate get routing.default_speed_kph.
NetworkPtr build_network_from_raw(const RawGraph &raw, const Point &center, double radius_m, const EngineConfig &config);

// Deterministic N x N lattice centred on `center`, both directions on every
// horizontal and vertical neighbour pair.
NetworkPtr synthesize_grid_network(const Point &center, double radius_m, const SynthesisConfig &synthesis,
                                   const CapacityModel &capacity);

// Provider graph when `provider` is set and answers with at least one node,
// otherwise the synthesized grid. Never throws for provider failure.
NetworkPtr fetch_or_synthesize(const FetchDrivableNetwork &provider, const Point &center, double radius_m,
                               const EngineConfig &config);

} // namespace road_geometry
