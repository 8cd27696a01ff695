#pragma once

#include <optional>
#include <vector>

#include "config.hpp"
#include "network.hpp"
#include "types.hpp"

namespace road_geometry
{

// Mean, median, population standard deviation, min and max; nullopt for an
// empty sample.
std::optional<CapacityStats> summarize(std::vector<double> values);

CapacityAnalysis estimate_capacity(const Network &network, const CapacityModel &model = {});

} // namespace road_geometry
