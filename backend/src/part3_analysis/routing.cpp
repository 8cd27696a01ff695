#include "road_geometry/routing.hpp"

#include <algorithm>
#include <functional>
#include <iostream>
#include <limits>
#include <queue>
#include <string>
#include <utility>
#include <vector>

#include "road_geometry/geometry.hpp"

namespace road_geometry
{
namespace
{

constexpr std::size_t kNoEdge = std::numeric_limits<std::size_t>::max();

void fill_geometry(const Network &network, RouteResult &route)
{
    route.coordinates.clear();
    route.coordinates.reserve(route.path_nodes.size());
    for (const long node_id : route.path_nodes)
    {
        const Node &node = network.node(node_id);
        route.coordinates.push_back({node.lat, node.lon});
    }

    route.travel_time_seconds = 0.0;
    route.distance_meters = 0.0;
    for (const std::size_t edge_index : route.path_edges)
    {
        const Edge &edge = network.edges()[edge_index];
        route.travel_time_seconds += edge.travel_time_s;
        route.distance_meters += edge.length_m;
    }
}

RouteResult no_path(long origin_node, long destination_node)
{
    RouteResult result;
    result.success = false;
    result.error_kind = ErrorKind::NoPathFound;
    result.error_message = "No path between node " + std::to_string(origin_node) + " and node " +
                           std::to_string(destination_node);
    return result;
}

} // namespace

long nearest_node(const Network &network, const Point &point)
{
    if (network.empty())
    {
        throw EngineError(ErrorKind::EmptyNetwork, "Network has no nodes to snap to");
    }

    long best_id = network.nodes().front().id;
    double best_dist = std::numeric_limits<double>::max();

    for (const auto &node : network.nodes())
    {
        const double dist = haversine(point.lat, point.lon, node.lat, node.lon);
        if (dist < best_dist)
        {
            best_dist = dist;
            best_id = node.id;
        }
    }

    return best_id;
}

RouteResult shortest_path_between(const Network &network, long origin_node, long destination_node, const EdgeMask *mask)
{
    const auto start = network.index_of(origin_node);
    const auto goal = network.index_of(destination_node);
    if (!start || !goal)
    {
        throw EngineError(ErrorKind::InvalidInput, "Route endpoints must be nodes of the network");
    }

    const std::size_t n = network.node_count();
    std::vector<double> distances(n, std::numeric_limits<double>::max());
    std::vector<std::size_t> parent_edge(n, kNoEdge);
    std::priority_queue<std::pair<double, std::size_t>,
                        std::vector<std::pair<double, std::size_t>>,
                        std::greater<std::pair<double, std::size_t>>>
        pq;

    distances[*start] = 0.0;
    pq.push({0.0, *start});

    while (!pq.empty())
    {
        const auto current_pair = pq.top();
        pq.pop();
        const double current_dist = current_pair.first;
        const std::size_t current_node = current_pair.second;

        if (current_dist > distances[current_node])
        {
            continue;
        }
        if (current_node == *goal)
        {
            break;
        }

        for (const std::size_t edge_index : network.out_edges(current_node))
        {
            if (mask && mask->excluded(edge_index))
            {
                continue;
            }

            const std::size_t neighbor = network.target_index(edge_index);
            const double new_dist = current_dist + network.edges()[edge_index].travel_time_s;
            if (new_dist < distances[neighbor])
            {
                distances[neighbor] = new_dist;
                parent_edge[neighbor] = edge_index;
                pq.push({new_dist, neighbor});
            }
        }
    }

    if (distances[*goal] == std::numeric_limits<double>::max())
    {
        return no_path(origin_node, destination_node);
    }

    RouteResult result;
    std::size_t node = *goal;
    while (node != *start)
    {
        const std::size_t edge_index = parent_edge[node];
        result.path_edges.push_back(edge_index);
        node = network.source_index(edge_index);
    }
    std::reverse(result.path_edges.begin(), result.path_edges.end());

    result.path_nodes.push_back(origin_node);
    for (const std::size_t edge_index : result.path_edges)
    {
        result.path_nodes.push_back(network.edges()[edge_index].target);
    }

    fill_geometry(network, result);
    result.success = true;
    return result;
}

RouteResult shortest_route(const Network &network, const Point &origin, const Point &destination)
{
    const long origin_node = nearest_node(network, origin);
    const long destination_node = nearest_node(network, destination);

    RouteResult route = shortest_path_between(network, origin_node, destination_node);
    route.route_type = "fastest";
    if (!route.success)
    {
        std::cerr << "[routing] " << route.error_message << std::endl;
    }
    return route;
}

std::optional<std::size_t> midpoint_edge(const RouteResult &primary)
{
    if (!primary.success || primary.path_edges.empty())
    {
        return std::nullopt;
    }

    // Edge (path[len/2], path[len/2 + 1]); a two-node path only has edge 0.
    const std::size_t middle = primary.path_nodes.size() / 2;
    return primary.path_edges[std::min(middle, primary.path_edges.size() - 1)];
}

RoutePlan alternate_route(const Network &network, const Point &origin, const Point &destination,
                          const std::vector<std::string> &avoid_segment_ids)
{
    RoutePlan plan;
    plan.primary = shortest_route(network, origin, destination);

    if (!avoid_segment_ids.empty())
    {
        std::cout << "[routing] Avoid list of " << avoid_segment_ids.size()
                  << " segment(s) has no edge mapping; removing the primary route's midpoint edge." << std::endl;
    }

    plan.removed_edge = midpoint_edge(plan.primary);
    if (!plan.removed_edge)
    {
        return plan;
    }

    EdgeMask mask(network.edge_count());
    mask.exclude(*plan.removed_edge);

    RouteResult alternate = shortest_path_between(network, plan.primary.path_nodes.front(),
                                                  plan.primary.path_nodes.back(), &mask);
    if (alternate.success)
    {
        alternate.route_type = "avoiding_congestion";
        plan.alternate = std::move(alternate);
    }
    else
    {
        std::cout << "[routing] No alternate once edge " << edge_label(network.edges()[*plan.removed_edge])
                  << " is removed." << std::endl;
    }

    return plan;
}

std::vector<AlternativeRouteSample> sample_alternative_routes(const Network &network)
{
    std::vector<AlternativeRouteSample> alternatives;

    const auto &nodes = network.nodes();
    if (nodes.size() < 4)
    {
        return alternatives;
    }

    const std::vector<std::pair<long, long>> sample_pairs = {
        {nodes.front().id, nodes.back().id},
        {nodes[nodes.size() / 4].id, nodes[3 * nodes.size() / 4].id}};

    for (const auto &[origin, destination] : sample_pairs)
    {
        RouteResult primary = shortest_path_between(network, origin, destination);
        if (!primary.success || primary.path_nodes.size() <= 2)
        {
            continue;
        }

        const auto removed = midpoint_edge(primary);
        EdgeMask mask(network.edge_count());
        mask.exclude(*removed);

        RouteResult alternative = shortest_path_between(network, origin, destination, &mask);
        if (!alternative.success)
        {
            continue;
        }

        primary.route_type = "fastest";
        alternative.route_type = "avoiding_congestion";

        AlternativeRouteSample sample;
        sample.origin_node = origin;
        sample.destination_node = destination;
        sample.time_difference = alternative.travel_time_seconds - primary.travel_time_seconds;
        sample.primary = std::move(primary);
        sample.alternative = std::move(alternative);
        alternatives.push_back(std::move(sample));
    }

    return alternatives;
}

} // namespace road_geometry
