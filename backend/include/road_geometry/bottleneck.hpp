#pragma once

#include <vector>

#include "config.hpp"
#include "network.hpp"
#include "types.hpp"

namespace road_geometry
{

// Betweenness centrality over the directed network, travel time as weight.
//
// Values are normalized like NetworkX does for directed graphs: node scores
// by 1/((n-1)(n-2)), edge scores by 1/(n(n-1)). Parallel edges are separate
// entities; each carries its own share of the shortest paths through it.
struct CentralityResult
{
    std::vector<double> node_betweenness;
    std::vector<double> edge_betweenness;
};

CentralityResult compute_betweenness(const Network &network);

// Linear interpolation between closest ranks; 0 for an empty sample.
double percentile(std::vector<double> values, double pct);

// Nodes and edges whose centrality strictly exceeds the percentile of their
// own kind, ranked by score and truncated to config.max_reports.
std::vector<BottleneckReport> find_bottlenecks(const Network &network, const BottleneckConfig &config = {});

} // namespace road_geometry
