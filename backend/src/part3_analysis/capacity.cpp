#include "road_geometry/capacity.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <utility>

namespace road_geometry
{

std::optional<CapacityStats> summarize(std::vector<double> values)
{
    if (values.empty())
    {
        return std::nullopt;
    }

    std::sort(values.begin(), values.end());

    const double count = static_cast<double>(values.size());
    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / count;

    double squared = 0.0;
    for (const double value : values)
    {
        squared += (value - mean) * (value - mean);
    }

    const std::size_t middle = values.size() / 2;
    const double median = values.size() % 2 == 0 ? (values[middle - 1] + values[middle]) / 2.0 : values[middle];

    CapacityStats stats;
    stats.mean = mean;
    stats.median = median;
    stats.std_dev = std::sqrt(squared / count);
    stats.min = values.front();
    stats.max = values.back();
    return stats;
}

CapacityAnalysis estimate_capacity(const Network &network, const CapacityModel &model)
{
    CapacityAnalysis analysis;

    std::vector<double> capacities;
    capacities.reserve(network.edge_count());

    for (const auto &edge : network.edges())
    {
        const double capacity = estimate_edge_capacity(edge.speed_kph, model);
        capacities.push_back(capacity);

        const ClassifiedEdge info{edge_label(edge), edge.length_m, edge.speed_kph, capacity};

        if (capacity > model.high_capacity_threshold)
        {
            analysis.high_capacity_roads.push_back(info);
        }
        else if (capacity < model.low_capacity_threshold)
        {
            analysis.low_capacity_roads.push_back(info);
        }
    }

    analysis.distribution = summarize(std::move(capacities));
    return analysis;
}

} // namespace road_geometry
