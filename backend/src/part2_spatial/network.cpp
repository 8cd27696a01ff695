#include "road_geometry/network.hpp"

#include <cmath>
#include <queue>
#include <string>
#include <utility>
#include <vector>

namespace road_geometry
{

const char *network_source_name(NetworkSource source)
{
    switch (source)
    {
    case NetworkSource::Provider:
        return "provider";
    case NetworkSource::Synthesized:
        return "synthesized";
    }
    return "unknown";
}

const char *error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "none";
    case ErrorKind::ProviderUnavailable:
        return "provider_unavailable";
    case ErrorKind::EmptyNetwork:
        return "empty_network";
    case ErrorKind::NoPathFound:
        return "no_path_found";
    case ErrorKind::InvalidInput:
        return "invalid_input";
    case ErrorKind::NotFound:
        return "not_found";
    }
    return "unknown";
}

double travel_time_seconds(double length_m, double speed_kph)
{
    return length_m / (speed_kph * 1000.0 / 3600.0);
}

double estimate_edge_capacity(double speed_kph, const CapacityModel &model)
{
    return (speed_kph / model.base_speed_kph) * model.base_capacity_vph;
}

Network::Network(Point center, double radius_m, NetworkSource source, CapacityModel capacity_model)
    : center_(center), radius_m_(radius_m), source_(source), capacity_model_(capacity_model)
{
}

bool Network::add_node(long id, double lat, double lon)
{
    if (index_.count(id))
    {
        return false;
    }

    index_[id] = nodes_.size();
    nodes_.push_back({id, lat, lon});
    out_edges_.emplace_back();
    in_edges_.emplace_back();
    return true;
}

std::size_t Network::add_edge(long source, long target, double length_m, double speed_kph)
{
    const auto source_it = index_.find(source);
    const auto target_it = index_.find(target);
    if (source_it == index_.end() || target_it == index_.end())
    {
        throw EngineError(ErrorKind::InvalidInput,
                          "Edge " + std::to_string(source) + "-" + std::to_string(target) +
                              " references a node outside the network");
    }
    if (!(length_m > 0.0) || !(speed_kph > 0.0) || !std::isfinite(length_m) || !std::isfinite(speed_kph))
    {
        throw EngineError(ErrorKind::InvalidInput,
                          "Edge " + std::to_string(source) + "-" + std::to_string(target) +
                              " needs positive length and speed");
    }

    Edge edge;
    edge.source = source;
    edge.target = target;
    edge.length_m = length_m;
    edge.speed_kph = speed_kph;
    edge.travel_time_s = travel_time_seconds(length_m, speed_kph);
    edge.capacity_vph = estimate_edge_capacity(speed_kph, capacity_model_);

    const std::size_t edge_index = edges_.size();
    edges_.push_back(edge);
    edge_endpoints_.push_back({source_it->second, target_it->second});
    out_edges_[source_it->second].push_back(edge_index);
    in_edges_[target_it->second].push_back(edge_index);
    return edge_index;
}

std::optional<std::size_t> Network::index_of(long node_id) const
{
    const auto it = index_.find(node_id);
    if (it == index_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

const Node &Network::node(long node_id) const
{
    const auto it = index_.find(node_id);
    if (it == index_.end())
    {
        throw EngineError(ErrorKind::InvalidInput, "Node " + std::to_string(node_id) + " is not in the network");
    }
    return nodes_[it->second];
}

std::size_t Network::degree(std::size_t node_index) const
{
    return out_edges_[node_index].size() + in_edges_[node_index].size();
}

std::optional<std::size_t> Network::find_edge(long source, long target) const
{
    const auto source_index = index_of(source);
    if (!source_index)
    {
        return std::nullopt;
    }

    for (const std::size_t edge_index : out_edges_[*source_index])
    {
        if (edges_[edge_index].target == target)
        {
            return edge_index;
        }
    }
    return std::nullopt;
}

void EdgeMask::exclude(std::size_t edge_index)
{
    if (edge_index < excluded_.size() && !excluded_[edge_index])
    {
        excluded_[edge_index] = true;
        count_++;
    }
}

bool EdgeMask::excluded(std::size_t edge_index) const
{
    return edge_index < excluded_.size() && excluded_[edge_index];
}

std::string edge_label(const Edge &edge)
{
    return std::to_string(edge.source) + "-" + std::to_string(edge.target);
}

NetworkStats compute_network_stats(const Network &network)
{
    NetworkStats stats;
    stats.total_nodes = network.node_count();
    stats.total_edges = network.edge_count();
    stats.source = network_source_name(network.source());

    double total_length = 0.0;
    for (const auto &edge : network.edges())
    {
        total_length += edge.length_m;
    }
    stats.total_length_km = total_length / 1000.0;

    const std::size_t n = network.node_count();
    if (n == 0)
    {
        return stats;
    }

    // Every directed edge adds one to an out-degree and one to an in-degree.
    stats.average_degree = 2.0 * static_cast<double>(stats.total_edges) / static_cast<double>(n);

    if (n > 1)
    {
        stats.density = static_cast<double>(stats.total_edges) / (static_cast<double>(n) * static_cast<double>(n - 1));
    }

    // Weak connectivity: breadth-first search ignoring edge direction.
    std::vector<bool> visited(n, false);
    std::queue<std::size_t> frontier;
    frontier.push(0);
    visited[0] = true;
    std::size_t reached = 1;

    while (!frontier.empty())
    {
        const std::size_t current = frontier.front();
        frontier.pop();

        for (const std::size_t edge_index : network.out_edges(current))
        {
            const std::size_t next = network.target_index(edge_index);
            if (!visited[next])
            {
                visited[next] = true;
                reached++;
                frontier.push(next);
            }
        }
        for (const std::size_t edge_index : network.in_edges(current))
        {
            const std::size_t next = network.source_index(edge_index);
            if (!visited[next])
            {
                visited[next] = true;
                reached++;
                frontier.push(next);
            }
        }
    }

    stats.connectivity = reached == n;
    return stats;
}

} // namespace road_geometry
